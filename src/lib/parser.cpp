#include <dtparse/parser.hpp>

#include <dtparse/date_util.hpp>
#include <dtparse/iso_parser.hpp>
#include <dtparse/lexicon.hpp>
#include <dtparse/parse_error.hpp>
#include <dtparse/token.hpp>

#include "ymd_resolver.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace dtparse {

  namespace {

    // -----------------------------------------------------------------------
    // Token helpers
    // -----------------------------------------------------------------------

    bool
    is_space_char(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    bool
    is_space(const token& t) {
      return t.kind == token_kind::separator && is_space_char(t.text[0]);
    }

    // Runs of whitespace become one " " token at the offset of the first.
    std::vector<token>
    collapse_whitespace(std::vector<token> tokens) {
      std::vector<token> result;
      result.reserve(tokens.size());
      for (auto& t : tokens) {
        if (is_space(t)) {
          if (!result.empty() && is_space(result.back())) { continue; }
          t.text = " ";
        }
        result.push_back(std::move(t));
      }
      return result;
    }

    bool
    is_upper_word(std::string_view word) {
      if (word.empty()) { return false; }
      for (char c : word) {
        if (c < 'A' || c > 'Z') { return false; }
      }
      return true;
    }

    // Runs longer than four digits only have meaning as compact forms.
    bool
    is_date_member(std::string_view digits) {
      return !digits.empty() && digits.size() <= 4;
    }

    int32_t
    to_int(std::string_view digits) {
      if (digits.empty() || digits.size() > 9) {
        throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                          "number out of range: " + std::string(digits));
      }
      int32_t value = 0;
      for (char c : digits) {
        value = value * 10 + (c - '0');
      }
      return value;
    }

    // `unit` times the fraction 0.<digits>, truncated.
    int
    scale_fraction(std::string_view digits, int unit) {
      int64_t numerator = 0;
      int64_t denominator = 1;
      for (std::size_t i = 0; i < digits.size() && i < 9; ++i) {
        numerator = numerator * 10 + (digits[i] - '0');
        denominator *= 10;
      }
      return static_cast<int>(numerator * unit / denominator);
    }

    // A digit run with an optional decimal fraction. `end` is the index of
    // the first token after the number.
    struct number {
      std::string_view digits;
      std::string_view fraction;
      std::size_t end;
    };

    // -----------------------------------------------------------------------
    // Resolver
    // -----------------------------------------------------------------------

    class resolver {
    public:
      resolver(std::string_view source, const parser_options& options)
          : source_(source),
            options_(options),
            tokens_(collapse_whitespace(tokenize(source))),
            skipped_(tokens_.size(), false),
            current_year_(current_year()) {}

      parse_result
      run() {
        std::size_t i = 0;
        while (i < tokens_.size()) {
          switch (tokens_[i].kind) {
            case token_kind::digits:
              i = on_number(i);
              break;
            case token_kind::letters:
              i = on_word(i);
              break;
            case token_kind::separator:
              i = on_separator(i);
              break;
          }
        }
        return finish();
      }

      std::vector<std::string>
      skipped_tokens() const {
        std::vector<std::string> result;
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
          if (skipped_[i]) { result.push_back(tokens_[i].text); }
        }
        return result;
      }

    private:
      std::string_view source_;
      parser_options options_;
      std::vector<token> tokens_;
      std::vector<bool> skipped_;
      int32_t current_year_;
      detail::ymd_resolver ymd_;
      parse_result res_;
      bool seen_ampm_ = false;
      // Set by "NAME+N": the offset that follows counts toward UTC.
      bool reverse_offset_sign_ = false;

      std::size_t
      size() const {
        return tokens_.size();
      }

      std::string_view
      text(std::size_t i) const {
        if (i >= tokens_.size()) { return {}; }
        return tokens_[i].text;
      }

      bool
      digits_at(std::size_t i) const {
        return i < tokens_.size() && tokens_[i].kind == token_kind::digits;
      }

      bool
      space_at(std::size_t i) const {
        return i < tokens_.size() && is_space(tokens_[i]);
      }

      std::optional<hms_label>
      hms_at(std::size_t i) const {
        if (i >= tokens_.size() || tokens_[i].kind != token_kind::letters) {
          return std::nullopt;
        }
        return lookup_hms(tokens_[i].text);
      }

      std::optional<meridiem>
      ampm_at(std::size_t i) const {
        if (i >= tokens_.size() || tokens_[i].kind != token_kind::letters) {
          return std::nullopt;
        }
        return lookup_ampm(tokens_[i].text);
      }

      template <typename T>
      void
      set(std::optional<T>& field, T value, const char* name) {
        if (field.has_value()) {
          throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                            std::string(name) + " is already set");
        }
        field = value;
      }

      // A token nothing could attribute: filler is dropped, anything else
      // is skipped in fuzzy mode and rejected otherwise.
      std::size_t
      leftover(std::size_t i) {
        if (is_jump(tokens_[i].text)) { return i + 1; }
        if (!options_.fuzzy) {
          throw parse_error(parse_errc::unrecognized_token,
                            "unrecognized token '" + tokens_[i].text + "'");
        }
        skipped_[i] = true;
        return i + 1;
      }

      number
      read_number(std::size_t i, bool allow_comma) const {
        number num{tokens_[i].text, {}, i + 1};
        std::string_view sep = text(i + 1);
        bool decimal_sep = sep == "." || (allow_comma && sep == ",");
        if (!decimal_sep || !digits_at(i + 2)) { return num; }
        // "2003.09.25" is a date, not a decimal.
        if (text(i + 3) == sep && digits_at(i + 4)) { return num; }
        num.fraction = tokens_[i + 2].text;
        num.end = i + 3;
        return num;
      }

      // -------------------------------------------------------------------
      // Numbers
      // -------------------------------------------------------------------

      std::size_t
      on_number(std::size_t i) {
        number num = read_number(i, false);
        std::string_view s = num.digits;
        std::size_t len = s.size();
        std::size_t next = i + 1;

        // 3rd, 21st
        if (len <= 2 && i + 1 < size() &&
            tokens_[i + 1].kind == token_kind::letters &&
            is_ordinal_suffix(text(i + 1))) {
          ymd_.append(to_int(s), len, detail::ymd_label::day);
          return i + 2;
        }

        // 20030925T10[49] after a complete date
        if (ymd_.size() == 3 && (len == 2 || len == 4) && !res_.hour &&
            (next >= size() || (text(next) != ":" && !hms_at(next)))) {
          set(res_.hour, static_cast<int>(to_int(s.substr(0, 2))), "hour");
          if (len == 4) {
            set(res_.minute, static_cast<int>(to_int(s.substr(2))), "minute");
          }
          return next;
        }

        // 1030h, 103045h
        if ((len == 4 || len == 6) && num.fraction.empty() && hms_at(next)) {
          set(res_.hour, static_cast<int>(to_int(s.substr(0, 2))), "hour");
          set(res_.minute, static_cast<int>(to_int(s.substr(2, 2))),
              "minute");
          if (len == 6) {
            set(res_.second, static_cast<int>(to_int(s.substr(4))), "second");
          }
          return next + 1;
        }

        // YYMMDD, or HHMMSS[.ffffff] once a date is known
        if (len == 6) {
          if (ymd_.empty() && num.fraction.empty()) {
            ymd_.append(to_int(s.substr(0, 2)), 2);
            ymd_.append(to_int(s.substr(2, 2)), 2);
            ymd_.append(to_int(s.substr(4, 2)), 2);
            return next;
          }
          set(res_.hour, static_cast<int>(to_int(s.substr(0, 2))), "hour");
          set(res_.minute, static_cast<int>(to_int(s.substr(2, 2))),
              "minute");
          set(res_.second, static_cast<int>(to_int(s.substr(4, 2))),
              "second");
          if (!num.fraction.empty()) {
            set(res_.microsecond, fraction_to_microseconds(num.fraction),
                "microsecond");
          }
          return num.end;
        }

        // YYYYMMDD[HHMM[SS]]
        if (len == 8 || len == 12 || len == 14) {
          ymd_.append(to_int(s.substr(0, 4)), 4, detail::ymd_label::year);
          ymd_.append(to_int(s.substr(4, 2)), 2);
          ymd_.append(to_int(s.substr(6, 2)), 2);
          if (len > 8) {
            set(res_.hour, static_cast<int>(to_int(s.substr(8, 2))), "hour");
            set(res_.minute, static_cast<int>(to_int(s.substr(10, 2))),
                "minute");
          }
          if (len > 12) {
            set(res_.second, static_cast<int>(to_int(s.substr(12, 2))),
                "second");
          }
          return next;
        }

        if (len > 4) { return leftover(i); }

        int32_t value = to_int(s);

        if (auto hms = find_hms(i, num.end)) {
          return on_labelled(i, num, *hms);
        }

        // HH:MM[:SS[.ffffff]]
        if (num.fraction.empty() && text(next) == ":" && digits_at(next + 1)) {
          return on_clock(num, value);
        }

        // 01-02[-03], 01/Jan/2003, 2003.09.25
        if (text(next) == "-" || text(next) == "/" || text(next) == ".") {
          return on_date_run(i, value, len);
        }

        if (next >= size() || is_jump(text(next))) {
          // "12 am"
          if (auto ampm = ampm_at(next + 1); ampm && ampm_applies(value)) {
            set(res_.hour, static_cast<int>(value), "hour");
            apply_ampm(value, *ampm);
            return next + 2;
          }
          ymd_.append(value, len);
          return next;
        }

        // "12am"
        if (auto ampm = ampm_at(next); ampm && ampm_applies(value)) {
          set(res_.hour, static_cast<int>(value), "hour");
          apply_ampm(value, *ampm);
          return next + 1;
        }

        if (ymd_.could_be_day(value)) {
          ymd_.append(value, len);
          return next;
        }

        return leftover(i);
      }

      struct hms_match {
        std::size_t label;
        bool forward;
      };

      // An h/m/s label right after the number, after one space, right
      // before it, or (for the last token) before it across one space.
      std::optional<hms_match>
      find_hms(std::size_t i, std::size_t end) const {
        if (hms_at(end)) { return hms_match{end, true}; }
        if (space_at(end) && hms_at(end + 1)) {
          return hms_match{end + 1, true};
        }
        if (i > 0 && hms_at(i - 1)) { return hms_match{i - 1, false}; }
        if (i > 1 && end == size() && space_at(i - 1) && hms_at(i - 2)) {
          return hms_match{i - 2, false};
        }
        return std::nullopt;
      }

      // 10h36m28.5s: a label before the number names the next unit down.
      std::size_t
      on_labelled(std::size_t i, const number& num, hms_match match) {
        int unit = static_cast<int>(*hms_at(match.label));
        if (!match.forward) { ++unit; }
        if (unit > static_cast<int>(hms_label::second)) {
          leftover(i);
          return num.end;
        }

        int value = static_cast<int>(to_int(num.digits));
        switch (static_cast<hms_label>(unit)) {
          case hms_label::hour:
            set(res_.hour, value, "hour");
            if (!num.fraction.empty()) {
              set(res_.minute, scale_fraction(num.fraction, 60), "minute");
            }
            break;
          case hms_label::minute:
            set(res_.minute, value, "minute");
            if (!num.fraction.empty()) {
              set(res_.second, scale_fraction(num.fraction, 60), "second");
            }
            break;
          case hms_label::second:
            set(res_.second, value, "second");
            if (!num.fraction.empty()) {
              set(res_.microsecond, fraction_to_microseconds(num.fraction),
                  "microsecond");
            }
            break;
        }
        return match.forward ? match.label + 1 : num.end;
      }

      std::size_t
      on_clock(const number& num, int32_t hour) {
        set(res_.hour, static_cast<int>(hour), "hour");

        number minute = read_number(num.end + 1, false);
        set(res_.minute, static_cast<int>(to_int(minute.digits)), "minute");
        if (!minute.fraction.empty()) {
          set(res_.second, scale_fraction(minute.fraction, 60), "second");
        }

        std::size_t next = minute.end;
        if (minute.fraction.empty() && text(next) == ":" &&
            digits_at(next + 1)) {
          number second = read_number(next + 1, true);
          set(res_.second, static_cast<int>(to_int(second.digits)), "second");
          if (!second.fraction.empty()) {
            set(res_.microsecond, fraction_to_microseconds(second.fraction),
                "microsecond");
          }
          next = second.end;
        }
        return next;
      }

      std::size_t
      on_date_run(std::size_t i, int32_t value, std::size_t len) {
        std::string_view sep = text(i + 1);
        ymd_.append(value, len);

        std::size_t j = i + 2;
        if (j >= size() || is_jump(text(j))) { return j; }
        // 7-1234567890123 is not a date.
        if (digits_at(j) && !is_date_member(text(j))) { return leftover(i); }
        if (!append_date_member(j)) { return j; }
        ++j;

        // A third member with the same separator.
        if (text(j) == sep && j + 1 < size() && append_date_member(j + 1)) {
          j += 2;
        }
        return j;
      }

      bool
      append_date_member(std::size_t j) {
        if (digits_at(j)) {
          if (!is_date_member(text(j))) { return false; }
          ymd_.append(to_int(text(j)), text(j).size());
          return true;
        }
        if (tokens_[j].kind == token_kind::letters) {
          if (auto month = lookup_month(text(j))) {
            ymd_.append(*month, 0, detail::ymd_label::month);
            return true;
          }
        }
        return false;
      }

      // -------------------------------------------------------------------
      // Words
      // -------------------------------------------------------------------

      std::size_t
      on_word(std::size_t i) {
        std::string_view word = tokens_[i].text;

        if (auto weekday = lookup_weekday(word)) {
          set(res_.weekday, *weekday, "weekday");
          return i + 1;
        }

        if (auto month = lookup_month(word)) { return on_month(i, *month); }

        if (auto ampm = lookup_ampm(word)) {
          if (res_.hour && ampm_applies(*res_.hour)) {
            apply_ampm(*res_.hour, *ampm);
            return i + 1;
          }
          return leftover(i);
        }

        if (could_be_tzname(word)) { return on_zone_name(i); }

        return leftover(i);
      }

      std::size_t
      on_month(std::size_t i, int month) {
        ymd_.append(month, 0, detail::ymd_label::month);

        // Jan-01[-99], Jan/01[/99]
        std::string_view sep = text(i + 1);
        if ((sep == "-" || sep == "/") && digits_at(i + 2) &&
            is_date_member(text(i + 2))) {
          ymd_.append(to_int(text(i + 2)), text(i + 2).size());
          if (text(i + 3) == sep && digits_at(i + 4) &&
              is_date_member(text(i + 4))) {
            ymd_.append(to_int(text(i + 4)), text(i + 4).size());
            return i + 5;
          }
          return i + 3;
        }

        // "Jan of 01": the number is a year.
        if (space_at(i + 1) && i + 2 < size() && is_pertain(text(i + 2)) &&
            space_at(i + 3) && digits_at(i + 4) &&
            is_date_member(text(i + 4))) {
          std::string_view digits = text(i + 4);
          int32_t year = expand_two_digit_year(to_int(digits), current_year_);
          ymd_.append(year, std::max<std::size_t>(digits.size(), 4),
                      detail::ymd_label::year);
          return i + 5;
        }
        return i + 1;
      }

      bool
      ampm_applies(int hour) const {
        return !seen_ampm_ && hour >= 0 && hour <= 12;
      }

      void
      apply_ampm(int hour, meridiem ampm) {
        if (hour < 12 && ampm == meridiem::pm) {
          hour += 12;
        } else if (hour == 12 && ampm == meridiem::am) {
          hour = 0;
        }
        res_.hour = hour;
        seen_ampm_ = true;
      }

      bool
      could_be_tzname(std::string_view word) const {
        return res_.hour && !res_.tzname && !res_.tzoffset &&
               word.size() <= 5 && (is_upper_word(word) || word == "z") &&
               !is_jump(word);
      }

      std::size_t
      on_zone_name(std::size_t i) {
        const std::string& name = tokens_[i].text;
        bool utc = is_utc_zone(name);

        // GMT+3 reads "my time +3 is GMT": the offset is reversed, and
        // the zone is not GMT itself.
        if (text(i + 1) == "+" || text(i + 1) == "-") {
          reverse_offset_sign_ = true;
          if (!utc) { res_.tzname = name; }
          return i + 1;
        }

        if (utc) {
          res_.tzoffset = 0;
          res_.tzname = (name == "Z" || name == "z") ? "UTC" : name;
        } else {
          res_.tzname = name;
        }
        return i + 1;
      }

      // -------------------------------------------------------------------
      // Separators
      // -------------------------------------------------------------------

      std::size_t
      on_separator(std::size_t i) {
        std::string_view sep = tokens_[i].text;
        if (res_.hour && (sep == "+" || sep == "-")) { return on_offset(i); }
        return leftover(i);
      }

      // -0300, +03:00, -3, optionally followed by " (NAME)"
      std::size_t
      on_offset(std::size_t i) {
        std::size_t start = tokens_[i].offset;
        auto offset =
            parse_utc_offset(source_.substr(start), offset_syntax::lenient);
        if (!offset) { return leftover(i); }

        int32_t seconds =
            reverse_offset_sign_ ? -offset->seconds : offset->seconds;
        reverse_offset_sign_ = false;
        set(res_.tzoffset, seconds, "utc offset");

        std::size_t j = i + 1;
        while (j < size() && tokens_[j].offset < start + offset->consumed) {
          ++j;
        }

        if (space_at(j) && text(j + 1) == "(" && j + 3 < size() &&
            tokens_[j + 2].kind == token_kind::letters && text(j + 3) == ")") {
          std::string_view name = text(j + 2);
          if (name.size() >= 3 && name.size() <= 5 && !res_.tzname &&
              is_upper_word(name)) {
            res_.tzname = std::string(name);
            j += 4;
          }
        }
        return j;
      }

      // -------------------------------------------------------------------
      // Result
      // -------------------------------------------------------------------

      parse_result
      finish() {
        auto ymd = ymd_.resolve(options_.yearfirst, options_.dayfirst,
                                current_year_);
        res_.year = ymd.year;
        res_.month = ymd.month;
        res_.day = ymd.day;

        if (!res_.has_date() && !res_.has_time()) {
          throw parse_error(parse_errc::no_components_found,
                            "no date or time found in '" +
                                std::string(source_) + "'");
        }
        validate();
        return res_;
      }

      void
      validate() const {
        auto check = [](const std::optional<int>& field, int lo, int hi,
                        const char* name) {
          if (field && (*field < lo || *field > hi)) {
            throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                              std::string(name) + " out of range: " +
                                  std::to_string(*field));
          }
        };
        check(res_.month, 1, 12, "month");
        int max_day = 31;
        if (res_.month) {
          max_day = days_in_month(res_.year.value_or(2000), *res_.month);
        }
        check(res_.day, 1, max_day, "day");
        check(res_.hour, 0, 23, "hour");
        check(res_.minute, 0, 59, "minute");
        check(res_.second, 0, 59, "second");
        if (res_.year && *res_.year < 1) {
          throw parse_error(parse_errc::ambiguous_or_invalid_numeric,
                            "year out of range: " + std::to_string(*res_.year));
        }
      }
    };

    void
    check_options(const parser_options& options) {
      if (options.fuzzy_with_tokens && !options.fuzzy) {
        throw std::invalid_argument("fuzzy_with_tokens requires fuzzy");
      }
    }

  } // namespace

  parser::parser(parser_options options) : options_(options) {
    check_options(options_);
  }

  parse_result
  parser::parse(std::string_view input) const {
    resolver r(input, options_);
    return r.run();
  }

  fuzzy_result
  parser::parse_fuzzy_with_tokens(std::string_view input) const {
    if (!options_.fuzzy) {
      throw std::invalid_argument("parse_fuzzy_with_tokens requires fuzzy");
    }
    resolver r(input, options_);
    parse_result result = r.run();
    return {std::move(result), r.skipped_tokens()};
  }

  parse_result
  parse(std::string_view input, parser_options options) {
    return parser(options).parse(input);
  }

  fuzzy_result
  parse_fuzzy_with_tokens(std::string_view input, parser_options options) {
    return parser(options).parse_fuzzy_with_tokens(input);
  }

  parse_result
  parse_time(std::string_view input) {
    parse_result found;
    try {
      found = parse_isotime(input);
    } catch (const parse_error&) {
      parser_options options;
      options.fuzzy = true;
      found = parser(options).parse(input);
    }
    if (!found.hour) {
      throw parse_error(parse_errc::no_components_found,
                        "no time of day found in '" + std::string(input) +
                            "'");
    }

    parse_result result;
    result.hour = found.hour;
    result.minute = found.minute;
    result.second = found.second;
    result.microsecond = found.microsecond;
    result.tzoffset = found.tzoffset;
    result.tzname = found.tzname;
    return result;
  }

} // namespace dtparse
