#include <courier/response/response-decoder.hxx>

#include <string>
#include <cassert>

using namespace std;
using namespace courier;

static const string fffd ("\xEF\xBF\xBD");

static void
test_charset ()
{
  assert (find_charset ("utf8") == "UTF-8");
  assert (find_charset ("UTF-8") == "UTF-8");
  assert (find_charset ("\"utf-8\"") == "UTF-8");
  assert (find_charset ("latin1") == "ISO-8859-1");
  assert (find_charset ("binary") == "ISO-8859-1");
  assert (find_charset ("ucs2") == "UTF-16LE");
  assert (find_charset ("utf-16le") == "UTF-16LE");
  assert (find_charset ("ascii") == "ASCII");
  assert (find_charset ("windows-1252"));

  assert (!find_charset (""));
  assert (!find_charset ("no-such-charset"));
}

static void
test_decode ()
{
  // A sequence split across chunks.
  //
  {
    charset_decoder d (string ("utf8"));
    assert (d.decode ("caf", 3) == "caf");
    assert (d.decode ("\xC3", 1) == "");
    assert (d.decode ("\xA9!", 2) == "\xC3\xA9!");
    assert (d.flush () == "");
  }

  // Unsupported and absent charsets fall back to UTF-8.
  //
  {
    charset_decoder d (string ("klingon"));
    assert (d.charset () == "UTF-8");

    charset_decoder n (nullopt);
    assert (n.charset () == "UTF-8");
  }

  {
    charset_decoder d (string ("latin1"));
    assert (d.decode ("caf\xE9", 4) == "caf\xC3\xA9");
  }

  {
    charset_decoder d (string ("utf-16le"));
    assert (d.decode ("h\0i", 3) == "h");
    assert (d.decode ("\0", 1) == "i");
  }

  // Invalid and truncated input.
  //
  {
    charset_decoder d (nullopt);
    assert (d.decode ("a\xFF" "b", 3) == "a" + fffd + "b");
    assert (d.decode ("\xE2\x82", 2) == "");
    assert (d.flush () == fffd);
  }
}

static void
test_unescape ()
{
  assert (unescape_unicode ("caf\\u00e9") == "caf\xC3\xA9");
  assert (unescape_unicode ("\\u4F60\\u597D") == "\xE4\xBD\xA0\xE5\xA5\xBD");
  assert (unescape_unicode ("\\ud83d\\ude00") == "\xF0\x9F\x98\x80");

  // Quotes stay escaped, everything else that is not an escape passes.
  //
  assert (unescape_unicode ("{\"a\":\"\\u0022x\\u0022\"}") ==
          "{\"a\":\"\\\"x\\\"\"}");
  assert (unescape_unicode ("\\n\\u12\\uZZZZ") == "\\n\\u12\\uZZZZ");

  // Lone surrogates.
  //
  assert (unescape_unicode ("\\ud83dx") == fffd + "x");
  assert (unescape_unicode ("\\ude00") == fffd);

  // Escapes split across chunks.
  //
  {
    unicode_unescaper u;
    assert (u.feed ("caf\\u00") == "caf");
    assert (u.feed ("e9 \\ud83d") == "\xC3\xA9 ");
    assert (u.feed ("\\ude00!") == "\xF0\x9F\x98\x80!");
    assert (u.feed ("end\\") == "end");
    assert (u.flush () == "\\");
  }
}

int
main ()
{
  test_charset ();
  test_decode ();
  test_unescape ();
}
