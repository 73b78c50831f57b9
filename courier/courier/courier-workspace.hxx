#pragma once

#include <utility>
#include <optional>
#include <filesystem>

namespace courier
{
  namespace fs = std::filesystem;

  // Provider of the base directories relative paths (certificates, etc) are
  // resolved against.
  //
  class workspace_context
  {
  public:
    virtual
    ~workspace_context () = default;

    // Workspace root directory, if a workspace is open.
    //
    virtual std::optional<fs::path>
    root () const = 0;

    // File the current request was declared in, if known.
    //
    virtual std::optional<fs::path>
    current_file () const = 0;
  };

  class static_workspace: public workspace_context
  {
  public:
    static_workspace () = default;

    static_workspace (std::optional<fs::path> r, std::optional<fs::path> f)
        : root_ (std::move (r)), current_file_ (std::move (f)) {}

    std::optional<fs::path>
    root () const override
    {
      return root_;
    }

    std::optional<fs::path>
    current_file () const override
    {
      return current_file_;
    }

  private:
    std::optional<fs::path> root_;
    std::optional<fs::path> current_file_;
  };
}
