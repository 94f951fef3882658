#include <depot/execution/code_generator.hpp>
#include <depot/schema/key/store_keys.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>

namespace key = depot::schema::key;

namespace depot::execution {

namespace {

template <typename T>
std::optional<T> parse_digits(const std::string_view text) {
  auto value = T{};
  for (auto c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

calendar_day_t to_calendar_day(const depot::schema::timestamp_milliseconds_t ts,
                               const int32_t utc_offset_minutes) {
  using namespace std::chrono;
  auto shifted = sys_time<milliseconds>{milliseconds{static_cast<int64_t>(ts)}} +
                 minutes{utc_offset_minutes};
  auto ymd = year_month_day{floor<days>(shifted)};
  return calendar_day_t{.year = static_cast<int32_t>(ymd.year()),
                        .month = static_cast<uint32_t>(ymd.month()),
                        .day = static_cast<uint32_t>(ymd.day())};
}

std::string to_compact_string(const calendar_day_t& day) {
  return fmt::format("{:04}{:02}{:02}", day.year, day.month, day.day);
}

std::string format_code(const calendar_day_t& day, const uint32_t sequence) {
  return fmt::format("{}{}-{:04}", kCodePrefix, to_compact_string(day),
                     sequence);
}

std::optional<parsed_code_t> parse_code(const std::string_view code) {
  // REQ- + YYYYMMDD + - + NNNN
  constexpr auto kCodeSize = kCodePrefix.size() + 8 + 1 + 4;
  if (code.size() != kCodeSize || !code.starts_with(kCodePrefix) ||
      code[kCodePrefix.size() + 8] != '-') {
    return std::nullopt;
  }
  auto date = code.substr(kCodePrefix.size(), 8);
  auto year = parse_digits<int32_t>(date.substr(0, 4));
  auto month = parse_digits<uint32_t>(date.substr(4, 2));
  auto day = parse_digits<uint32_t>(date.substr(6, 2));
  auto sequence = parse_digits<uint32_t>(code.substr(kCodePrefix.size() + 9));
  if (!year || !month || !day || !sequence || *sequence == 0) {
    return std::nullopt;
  }
  auto ymd = std::chrono::year_month_day{std::chrono::year{*year},
                                         std::chrono::month{*month},
                                         std::chrono::day{*day}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return parsed_code_t{
      .day = calendar_day_t{.year = *year, .month = *month, .day = *day},
      .sequence = *sequence};
}

code_generator::code_generator(depot::store::encoder_t& encoder)
    : encoder_{encoder} {}

std::string code_generator::next_code(depot::store::transaction_t& txn,
                                      const calendar_day_t& day) const {
  auto counter_key = key::make_day_sequence_key(to_compact_string(day));
  auto last = txn.get_for_update<uint64_t>(encoder_, counter_key).value_or(0);
  for (auto sequence = last + 1; sequence <= kMaxDailySequence; ++sequence) {
    auto code = format_code(day, static_cast<uint32_t>(sequence));
    if (txn.get_for_update<uint64_t>(encoder_, key::make_code_index_key(code))) {
      spdlog::warn("requisition code {} already taken, advancing", code);
      continue;
    }
    txn.put(encoder_, counter_key, sequence);
    spdlog::debug("issued requisition code {}", code);
    return code;
  }
  throw code_generation_error{fmt::format(
      "daily requisition sequence exhausted for {}", to_compact_string(day))};
}

}  // namespace depot::execution
