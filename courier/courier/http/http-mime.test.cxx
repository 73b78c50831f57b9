#include <courier/http/http-mime.hxx>

#include <cassert>

using namespace std;
using namespace courier;

static void
test_essence ()
{
  assert (parse_media_type ("text/event-stream").essence () ==
          "text/event-stream");
  assert (parse_media_type ("Text/Event-Stream; charset=utf-8").essence () ==
          "text/event-stream");
  assert (parse_media_type (" application/json ;charset=UTF-8").essence () ==
          "application/json");
  assert (parse_media_type ("text").essence () == "text");
}

static void
test_parameters ()
{
  {
    media_type m (parse_media_type ("text/html; Charset=ISO-8859-1"));
    assert (m.charset () == "ISO-8859-1");
  }

  {
    media_type m (parse_media_type (
      "multipart/form-data; boundary=\"a;b\\\"c\"; charset=latin1"));
    assert (m.parameters["boundary"] == "a;b\"c");
    assert (m.charset () == "latin1");
  }

  assert (!parse_media_type ("application/json").charset ());
  assert (!parse_media_type ("application/json; charset=").charset ());
  assert (!parse_media_type ("application/json; junk; ").charset ());
}

int
main ()
{
  test_essence ();
  test_parameters ();
}
