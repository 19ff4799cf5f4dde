#include "core/types.hpp"

#include <cstdio>
#include <type_traits>

namespace marginalia {

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

CivilTime Timestamp::to_civil() const {
    using namespace std::chrono;
    const auto tp = sys_time<milliseconds>(milliseconds(millis_));
    const auto day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss<milliseconds> tod{tp - day};

    CivilTime civil;
    civil.year = static_cast<int>(ymd.year());
    civil.month = static_cast<int>(static_cast<unsigned>(ymd.month()));
    civil.day = static_cast<int>(static_cast<unsigned>(ymd.day()));
    civil.hour = static_cast<int>(tod.hours().count());
    civil.minute = static_cast<int>(tod.minutes().count());
    civil.second = static_cast<int>(tod.seconds().count());
    civil.millisecond = static_cast<int>(tod.subseconds().count());
    return civil;
}

std::string Timestamp::to_iso_string() const {
    const auto c = to_civil();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  c.year, c.month, c.day, c.hour, c.minute, c.second, c.millisecond);
    return buf;
}

std::string Timestamp::to_iso_date() const {
    const auto c = to_civil();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
    return buf;
}

} // namespace marginalia
