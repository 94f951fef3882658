#pragma once
#include <depot/schema/primitives.hpp>
#include <depot/store/types.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace depot::execution {

inline constexpr std::string_view kCodePrefix{"REQ-"};
inline constexpr uint32_t kMaxDailySequence = 9999;

struct calendar_day_t final {
  int32_t year{};
  uint32_t month{};
  uint32_t day{};

  auto operator<=>(const calendar_day_t&) const = default;
};

/// Calendar day of timestamp after shifting it by a fixed UTC offset.
calendar_day_t to_calendar_day(depot::schema::timestamp_milliseconds_t ts,
                               int32_t utc_offset_minutes);

/// "YYYYMMDD".
std::string to_compact_string(const calendar_day_t& day);

/// "REQ-YYYYMMDD-NNNN".
std::string format_code(const calendar_day_t& day, uint32_t sequence);

struct parsed_code_t final {
  calendar_day_t day;
  uint32_t sequence{};
};

/// Inverse of format_code; rejects impossible dates and sequence 0.
std::optional<parsed_code_t> parse_code(std::string_view code);

/// Raised when no code is left for the day.
class code_generation_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Issues gap-free daily requisition codes.
///
/// The day counter row is read under an exclusive lock and advanced in the
/// caller's transaction, so concurrent creations serialize on it and an
/// aborted creation gives its number back. Codes already present in the code
/// index are skipped.
class code_generator final {
 public:
  explicit code_generator(depot::store::encoder_t& encoder);

  std::string next_code(depot::store::transaction_t& txn,
                        const calendar_day_t& day) const;

 private:
  depot::store::encoder_t& encoder_;
};

}  // namespace depot::execution
