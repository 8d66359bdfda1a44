#include "domain/events/DomainEvent.hpp"
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace accounting::domain {

std::string DomainEvent::nextEventId() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint32_t> dist;

    std::ostringstream ss;
    ss << "evt-" << Timestamp::now().toUnixMillis() << "-"
       << std::hex << std::setfill('0') << std::setw(8) << dist(gen);
    return ss.str();
}

} // namespace accounting::domain
