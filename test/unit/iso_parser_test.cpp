#include <dtparse/iso_parser.hpp>
#include <dtparse/parse_error.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

  template <typename F>
  std::optional<dtparse::parse_errc>
  error_of(F&& f) {
    try {
      f();
    } catch (const dtparse::parse_error& e) {
      return e.code();
    }
    return std::nullopt;
  }

  void
  check_date(const dtparse::parse_result& r, int32_t y, int m, int d) {
    CHECK(r.year == y);
    CHECK(r.month == m);
    CHECK(r.day == d);
  }

  // Writes every field back out in extended format.
  std::string
  to_iso(const dtparse::parse_result& r) {
    std::ostringstream os;
    os << std::setfill('0') << std::setw(4) << *r.year << '-' << std::setw(2)
       << *r.month << '-' << std::setw(2) << *r.day << 'T' << std::setw(2)
       << *r.hour << ':' << std::setw(2) << *r.minute << ':' << std::setw(2)
       << *r.second << '.' << std::setw(6) << *r.microsecond;
    if (r.tzname == "UTC") {
      os << 'Z';
    } else if (r.tzoffset) {
      int32_t minutes = std::abs(*r.tzoffset) / 60;
      os << (*r.tzoffset < 0 ? '-' : '+') << std::setw(2) << minutes / 60
         << ':' << std::setw(2) << minutes % 60;
    }
    return os.str();
  }

} // namespace

TEST_CASE("isoparse reduced dates", "[iso]") {
  SECTION("year only") {
    auto r = dtparse::isoparse("2016");
    check_date(r, 2016, 1, 1);
    CHECK_FALSE(r.hour.has_value());
    CHECK_FALSE(r.has_time());
  }
  SECTION("year and month") {
    check_date(dtparse::isoparse("2016-03"), 2016, 3, 1);
  }
  SECTION("basic year and month is not allowed") {
    CHECK(error_of([] { dtparse::isoparse("201603"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
  }
}

TEST_CASE("isoparse full date-times", "[iso]") {
  SECTION("extended with nanoseconds and offset") {
    auto r = dtparse::isoparse("2016-03-08T10:30:45.123456789+05:30");
    check_date(r, 2016, 3, 8);
    CHECK(r.hour == 10);
    CHECK(r.minute == 30);
    CHECK(r.second == 45);
    CHECK(r.microsecond == 123456);
    CHECK(r.tzoffset == 19800);
    CHECK_FALSE(r.tzname.has_value());
  }
  SECTION("basic format with Z") {
    auto r = dtparse::isoparse("20160308T103045Z");
    check_date(r, 2016, 3, 8);
    CHECK(r.hour == 10);
    CHECK(r.minute == 30);
    CHECK(r.second == 45);
    CHECK(r.tzoffset == 0);
    CHECK(r.tzname == "UTC");
  }
  SECTION("hour only fills the lower fields with zero") {
    auto r = dtparse::isoparse("2016-03-08T10");
    CHECK(r.hour == 10);
    CHECK(r.minute == 0);
    CHECK(r.second == 0);
    CHECK(r.microsecond == 0);
    CHECK_FALSE(r.tzoffset.has_value());
  }
}

TEST_CASE("isoparse separators and whitespace", "[iso]") {
  SECTION("custom separator") {
    auto r = dtparse::isoparse("2016-03-08 10:30", ' ');
    CHECK(r.hour == 10);
    CHECK(r.minute == 30);
  }
  SECTION("wrong separator") {
    CHECK(error_of([] { dtparse::isoparse("2016-03-08 10:30"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
  }
  SECTION("trailing whitespace is ignored") {
    CHECK(dtparse::isoparse("2016-03-08T10:30  \n").minute == 30);
  }
  SECTION("trailing words are not") {
    CHECK(error_of([] { dtparse::isoparse("2016-03-08T10:30 PM"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
  }
  SECTION("non-ASCII or numeric separators are rejected") {
    CHECK_THROWS_AS(dtparse::iso_parser('5'), std::invalid_argument);
    CHECK_THROWS_AS(dtparse::iso_parser('\xc3'), std::invalid_argument);
    CHECK(dtparse::iso_parser(' ').separator() == ' ');
  }
}

TEST_CASE("24:00 is midnight of the next day", "[iso]") {
  SECTION("within a month") {
    auto r = dtparse::isoparse("2014-04-11T24:00");
    check_date(r, 2014, 4, 12);
    CHECK(r.hour == 0);
    CHECK(r.minute == 0);
  }
  SECTION("across a year") {
    auto r = dtparse::isoparse("2014-12-31T24:00:00");
    check_date(r, 2015, 1, 1);
    CHECK(r.hour == 0);
  }
  SECTION("only exactly 24:00:00") {
    CHECK(error_of([] { dtparse::isoparse("2014-04-11T24:00:01"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
  }
  SECTION("time only") {
    CHECK(dtparse::parse_isotime("24:00").hour == 0);
  }
  SECTION("hour 25") {
    CHECK(error_of([] { dtparse::isoparse("2014-04-11T25:00"); }) ==
          dtparse::parse_errc::ambiguous_or_invalid_numeric);
  }
}

TEST_CASE("isoparse week dates", "[iso][week]") {
  check_date(dtparse::isoparse("2015W53"), 2015, 12, 28);
  check_date(dtparse::isoparse("2009-W53-7"), 2010, 1, 3);
  check_date(dtparse::isoparse("2009-W01-1"), 2008, 12, 29);
  check_date(dtparse::isoparse("2012-W05-5"), 2012, 2, 3);
  check_date(dtparse::isoparse("2012W055"), 2012, 2, 3);

  SECTION("week without a day may carry a time") {
    auto r = dtparse::isoparse("2012-W05T10:00");
    check_date(r, 2012, 1, 30);
    CHECK(r.hour == 10);
  }
  SECTION("week 53 in a 52-week year") {
    CHECK(error_of([] { dtparse::isoparse("2014-W53"); }) ==
          dtparse::parse_errc::invalid_week_date);
  }
  SECTION("day of week 8") {
    CHECK(error_of([] { dtparse::isoparse("2009-W01-8"); }) ==
          dtparse::parse_errc::invalid_week_date);
  }
  SECTION("mixed dash usage") {
    CHECK(error_of([] { dtparse::isoparse("2012-W055"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
    CHECK(error_of([] { dtparse::isoparse("2012W05-5"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
  }
}

TEST_CASE("a zone needs an hour before it", "[iso]") {
  CHECK(error_of([] { dtparse::isoparse("2024-01-15T+05:00"); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
  CHECK(error_of([] { dtparse::isoparse("2024-01-15TZ"); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
  CHECK(error_of([] { dtparse::parse_isotime("+0500"); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
  CHECK(error_of([] { dtparse::parse_isotime("Z"); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
  CHECK(dtparse::parse_isotime("10Z").tzoffset == 0);
}

TEST_CASE("isoparse ordinal dates", "[iso]") {
  check_date(dtparse::isoparse("2016-060"), 2016, 2, 29);
  check_date(dtparse::isoparse("2016060"), 2016, 2, 29);
  check_date(dtparse::isoparse("2015-365"), 2015, 12, 31);
  CHECK(error_of([] { dtparse::isoparse("2015-366"); }) ==
        dtparse::parse_errc::ambiguous_or_invalid_numeric);
}

TEST_CASE("isoparse rejects invalid input", "[iso]") {
  CHECK(error_of([] { dtparse::isoparse(""); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
  CHECK(error_of([] { dtparse::isoparse("16-03-08"); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
  CHECK(error_of([] { dtparse::isoparse("2016-13-01"); }) ==
        dtparse::parse_errc::ambiguous_or_invalid_numeric);
  CHECK(error_of([] { dtparse::isoparse("2015-02-29"); }) ==
        dtparse::parse_errc::ambiguous_or_invalid_numeric);
  CHECK(error_of([] { dtparse::isoparse("0000-01-01"); }) ==
        dtparse::parse_errc::ambiguous_or_invalid_numeric);
  CHECK(error_of([] {
          dtparse::isoparse("2016-03-08T10:30:45.1234567890");
        }) == dtparse::parse_errc::malformed_iso_grammar);
  CHECK(error_of([] { dtparse::isoparse("2016-03-08T10:60"); }) ==
        dtparse::parse_errc::ambiguous_or_invalid_numeric);
}

TEST_CASE("parse_isodate", "[iso]") {
  check_date(dtparse::parse_isodate("2016-03-08"), 2016, 3, 8);
  CHECK_FALSE(dtparse::parse_isodate("2016-03-08").has_time());
  CHECK(error_of([] { dtparse::parse_isodate("2016-03-08T10"); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
}

TEST_CASE("parse_isotime", "[iso]") {
  SECTION("comma fraction") {
    CHECK(dtparse::parse_isotime("10:30:45,5").microsecond == 500000);
  }
  SECTION("basic format") {
    auto r = dtparse::parse_isotime("103045");
    CHECK(r.hour == 10);
    CHECK(r.minute == 30);
    CHECK(r.second == 45);
    CHECK_FALSE(r.has_date());
  }
  SECTION("fractions only follow seconds") {
    CHECK(error_of([] { dtparse::parse_isotime("10.5"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
  }
  SECTION("colon usage must be consistent") {
    CHECK(error_of([] { dtparse::parse_isotime("1030:45"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
  }
  SECTION("offsets") {
    CHECK(dtparse::parse_isotime("10:30+05").tzoffset == 18000);
    CHECK(dtparse::parse_isotime("10:30-0130").tzoffset == -5400);
    CHECK(error_of([] { dtparse::parse_isotime("10:30+5"); }) ==
          dtparse::parse_errc::malformed_iso_grammar);
    CHECK(error_of([] { dtparse::parse_isotime("10:30+24:00"); }) ==
          dtparse::parse_errc::ambiguous_or_invalid_numeric);
  }
}

TEST_CASE("parse_tzstr", "[iso]") {
  dtparse::iso_parser p;

  auto z = p.parse_tzstr("Z");
  CHECK(z.tzoffset == 0);
  CHECK(z.tzname == "UTC");
  CHECK_FALSE(z.has_time());

  auto west = p.parse_tzstr("-03:00");
  CHECK(west.tzoffset == -10800);
  CHECK_FALSE(west.tzname.has_value());

  CHECK(error_of([&] { p.parse_tzstr("EST"); }) ==
        dtparse::parse_errc::malformed_iso_grammar);
}

TEST_CASE("fully specified values survive a write and re-read", "[iso]") {
  for (const char* input : {"2016-03-08T10:30:45.123456+05:30",
                            "1999-12-31T23:59:59.000001Z",
                            "0001-01-01T00:00:00.000000",
                            "2024-02-29T12:00:00.5-09:30"}) {
    INFO("input: " << input);
    auto first = dtparse::isoparse(input);
    auto second = dtparse::isoparse(to_iso(first));
    CHECK(first == second);
  }
}
