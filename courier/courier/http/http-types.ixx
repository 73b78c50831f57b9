#include <algorithm>
#include <unordered_map>

namespace courier
{
  // basic_http_headers
  //

  // Set a header, replacing any existing values.
  //
  // HTTP allows multiple headers with the same name (e.g., Set-Cookie), but
  // set() enforces the "single value" semantics by clearing duplicates first.
  // The replacement is stored under the name given here.
  //
  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    remove (n);
    fields.push_back (field_type (std::move (n), std::move (v)));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type n, string_type v)
  {
    fields.push_back (field_type (std::move (n), std::move (v)));
  }

  // Returns the first occurrence if multiple exist. The search is case-
  // insensitive as per RFC 7230.
  //
  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& n) const
  {
    auto i (std::find_if (fields.begin (), fields.end (),
                          [&n] (const field_type& f)
                          {
                            return iequals (f.name, n);
                          }));

    return i != fields.end () ? std::optional<string_type> (i->value)
                              : std::nullopt;
  }

  template <typename S>
  inline bool basic_http_headers<S>::
  contains (const string_type& n) const
  {
    return get (n).has_value ();
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    fields.erase (std::remove_if (fields.begin (), fields.end (),
                                  [&n] (const field_type& f)
                                  {
                                    return iequals (f.name, n);
                                  }),
                  fields.end ());
  }

  template <typename S>
  inline std::vector<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  names () const
  {
    std::vector<string_type> r;
    r.reserve (fields.size ());

    for (const field_type& f: fields)
      r.push_back (f.name);

    return r;
  }

  template <typename S>
  basic_http_headers<S>
  normalize_header_names (const basic_http_headers<S>& h,
                          const std::vector<S>& raw)
  {
    // Build the lower-case index once. Note that we only insert on the first
    // sighting so that a later, differently-cased duplicate never wins.
    //
    std::unordered_map<S, S> idx;

    for (const S& n: raw)
      idx.emplace (to_lower (n), n);

    basic_http_headers<S> r;
    r.fields.reserve (h.size ());

    for (const auto& f: h)
    {
      auto i (idx.find (to_lower (f.name)));
      r.add (i != idx.end () ? i->second : f.name, f.value);
    }

    return r;
  }
}
