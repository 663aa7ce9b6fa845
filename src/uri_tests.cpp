#include "uri.h"

#include "doctest.h"

#include <string>

TEST_CASE("uri_normalize lowercases scheme and host but not path") {
  CHECK(harvest::uri_normalize("HTTPS://Example.COM/Some/Path") ==
        "https://example.com/Some/Path");
}

TEST_CASE("uri_normalize drops default ports only for matching schemes") {
  CHECK(harvest::uri_normalize("http://example.com:80/a") == "http://example.com/a");
  CHECK(harvest::uri_normalize("https://example.com:443/a") == "https://example.com/a");
  CHECK(harvest::uri_normalize("http://example.com:443/a") == "http://example.com:443/a");
  CHECK(harvest::uri_normalize("http://example.com:8080/a") == "http://example.com:8080/a");
  CHECK(harvest::uri_normalize("https://user@example.com:443/") ==
        "https://user@example.com/");
  CHECK(harvest::uri_normalize("http://[::1]/x") == "http://[::1]/x");
}

TEST_CASE("uri_normalize path rules") {
  CHECK(harvest::uri_normalize("https://example.com") == "https://example.com/");
  CHECK(harvest::uri_normalize("https://example.com/") == "https://example.com/");
  CHECK(harvest::uri_normalize("https://example.com/a/") == "https://example.com/a");
  CHECK(harvest::uri_normalize("https://example.com/a///") == "https://example.com/a");
  CHECK(harvest::uri_normalize("https://example.com//") == "https://example.com/");
}

TEST_CASE("uri_normalize sorts query parameters and drops fragment") {
  CHECK(harvest::uri_normalize("https://example.com/p?b=2&a=1#section") ==
        "https://example.com/p?a=1&b=2");
  CHECK(harvest::uri_normalize("https://example.com/p?a=2&a=1") ==
        "https://example.com/p?a=1&a=2");
  CHECK(harvest::uri_normalize("https://example.com/p?flag&a=1") ==
        "https://example.com/p?a=1&flag=");
  CHECK(harvest::uri_normalize("https://example.com/p?&&") == "https://example.com/p");
  CHECK(harvest::uri_normalize("https://example.com/p/?x=1") ==
        "https://example.com/p?x=1");
}

TEST_CASE("uri_normalize equivalent spellings collapse") {
  auto const a{ harvest::uri_normalize("  HTTP://Example.com:80/docs/?z=9&y=8#top ") };
  auto const b{ harvest::uri_normalize("http://example.com/docs?y=8&z=9") };
  CHECK(a == b);
}

TEST_CASE("uri_normalize keeps scheme-less input as a path") {
  CHECK(harvest::uri_normalize("example.com/a/") == "example.com/a");
  CHECK(harvest::uri_normalize("file:///tmp/page.html") == "file:///tmp/page.html");
}

TEST_CASE("uri_extract_first finds first url token") {
  CHECK(harvest::uri_extract_first("see https://example.com/a for details") ==
        std::string{ "https://example.com/a" });
  CHECK(harvest::uri_extract_first("http://one.test http://two.test") ==
        std::string{ "http://one.test" });
  CHECK(harvest::uri_extract_first("local\tfile:///tmp/x.html\n") ==
        std::string{ "file:///tmp/x.html" });
  CHECK(harvest::uri_extract_first("HTTPS://Upper.test") ==
        std::string{ "HTTPS://Upper.test" });
}

TEST_CASE("uri_extract_first returns nullopt without url") {
  CHECK_FALSE(harvest::uri_extract_first("no link here").has_value());
  CHECK_FALSE(harvest::uri_extract_first("").has_value());
  CHECK_FALSE(harvest::uri_extract_first("ftp://example.com").has_value());
}
