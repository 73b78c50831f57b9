#pragma once

#include <string>
#include <chrono>
#include <optional>

#include <courier/http/http-transport.hxx>

namespace courier
{
  // AWS credentials and scope taken from an authorization line of the form:
  //
  // AWS <accessKeyId> <secretAccessKey> [token:<t>] [region:<r>] [service:<s>]
  //
  struct aws_credentials
  {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
    std::optional<std::string> region;
    std::optional<std::string> service;
  };

  // Throw auth_resolution_error if the line is malformed.
  //
  aws_credentials
  parse_aws_authorization (const std::string&);

  // Sign the request with AWS Signature Version 4 as of the specified time,
  // adding X-Amz-Date, X-Amz-Security-Token (with a session token),
  // X-Amz-Content-Sha256 (for s3), and Authorization.
  //
  // Region and service missing from the credentials are inferred from an
  // *.amazonaws.com host. Throw auth_resolution_error if the service cannot
  // be determined.
  //
  void
  sign_aws_v4 (transport_request&,
               const aws_credentials&,
               std::chrono::system_clock::time_point);

  // Pre-request hook signing each issued request at send time.
  //
  before_request_hook
  aws_signature_hook (const std::string& authorization);
}
