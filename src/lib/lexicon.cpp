#include <dtparse/lexicon.hpp>

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace dtparse {

  namespace {

    std::string
    lower(std::string_view word) {
      std::string result(word);
      for (auto& c : result) {
        if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); }
      }
      return result;
    }

    const std::unordered_map<std::string, int> months = {
        {"jan", 1},       {"january", 1},  {"feb", 2},      {"february", 2},
        {"mar", 3},       {"march", 3},    {"apr", 4},      {"april", 4},
        {"may", 5},       {"jun", 6},      {"june", 6},     {"jul", 7},
        {"july", 7},      {"aug", 8},      {"august", 8},   {"sep", 9},
        {"sept", 9},      {"september", 9}, {"oct", 10},    {"october", 10},
        {"nov", 11},      {"november", 11}, {"dec", 12},    {"december", 12},
    };

    const std::unordered_map<std::string, int> weekdays = {
        {"mon", 0},      {"monday", 0},   {"tue", 1},    {"tues", 1},
        {"tuesday", 1},  {"wed", 2},      {"wednesday", 2}, {"thu", 3},
        {"thur", 3},     {"thurs", 3},    {"thursday", 3}, {"fri", 4},
        {"friday", 4},   {"sat", 5},      {"saturday", 5}, {"sun", 6},
        {"sunday", 6},
    };

    const std::unordered_map<std::string, meridiem> ampm_words = {
        {"am", meridiem::am},
        {"a", meridiem::am},
        {"pm", meridiem::pm},
        {"p", meridiem::pm},
    };

    const std::unordered_map<std::string, hms_label> hms_words = {
        {"h", hms_label::hour},       {"hour", hms_label::hour},
        {"hours", hms_label::hour},   {"m", hms_label::minute},
        {"minute", hms_label::minute}, {"minutes", hms_label::minute},
        {"s", hms_label::second},     {"second", hms_label::second},
        {"seconds", hms_label::second},
    };

    const std::unordered_set<std::string> jump_words = {
        " ",  ".",  ",",   ";",  "-",  "/",  "'", "at", "on",
        "and", "ad", "m", "t", "of", "st", "nd", "rd", "th",
    };

    const std::unordered_set<std::string> ordinal_suffixes = {
        "st", "nd", "rd", "th"};

    const std::unordered_set<std::string> utc_zones = {"utc", "gmt", "z"};

    template <typename Map>
    std::optional<typename Map::mapped_type>
    find_in(const Map& table, std::string_view word) {
      auto it = table.find(lower(word));
      if (it == table.end()) { return std::nullopt; }
      return it->second;
    }

  } // namespace

  std::optional<int>
  lookup_month(std::string_view word) {
    return find_in(months, word);
  }

  std::optional<int>
  lookup_weekday(std::string_view word) {
    return find_in(weekdays, word);
  }

  std::optional<meridiem>
  lookup_ampm(std::string_view word) {
    return find_in(ampm_words, word);
  }

  std::optional<hms_label>
  lookup_hms(std::string_view word) {
    return find_in(hms_words, word);
  }

  bool
  is_jump(std::string_view word) {
    if (word.size() == 1 && (word[0] == '\t' || word[0] == '\n' ||
                             word[0] == '\r' || word[0] == '\f' ||
                             word[0] == '\v')) {
      return true;
    }
    return jump_words.contains(lower(word));
  }

  bool
  is_pertain(std::string_view word) {
    return lower(word) == "of";
  }

  bool
  is_ordinal_suffix(std::string_view word) {
    return ordinal_suffixes.contains(lower(word));
  }

  bool
  is_utc_zone(std::string_view word) {
    return utc_zones.contains(lower(word));
  }

} // namespace dtparse
