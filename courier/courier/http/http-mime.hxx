#pragma once

#include <map>
#include <string>
#include <optional>

namespace courier
{
  // Parsed Content-Type value.
  //
  struct media_type
  {
    std::string type;        // Lower-case, e.g., "text".
    std::string subtype;     // Lower-case, e.g., "event-stream".
    std::map<std::string, std::string> parameters; // Names lower-cased.

    // Top-level media type without any parameters ("text/event-stream").
    //
    std::string
    essence () const
    {
      return subtype.empty () ? type : type + '/' + subtype;
    }

    std::optional<std::string>
    charset () const
    {
      auto i (parameters.find ("charset"));
      return i != parameters.end () && !i->second.empty ()
        ? std::optional<std::string> (i->second)
        : std::nullopt;
    }
  };

  // Parse a Content-Type header value. Never throws: malformed parameters
  // are skipped.
  //
  media_type
  parse_media_type (const std::string&);
}
