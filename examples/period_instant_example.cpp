#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/cfg/env.h>
#include <tempo.hpp>

using namespace tempo;

// Helper function to print a Period and what it becomes as a Timeout
void printPeriod(const std::string& text) {
    std::cout << "  \"" << text << "\"\n";
    auto period = Period::parse(text);
    if (!period) {
        std::cout << "    error: " << period.error().message() << "\n";
        return;
    }
    std::cout << "    canonical: " << *period << "\n";
    std::cout << "    seconds: " << period->seconds() << ", nanoseconds: " << period->nanoseconds()
              << "\n";
    std::cout << "    timeout: " << Timeout::from_period(*period).milliseconds() << " ms\n";
}

// Helper function to print an Instant in its own offset and in UTC
void printInstant(const std::string& text) {
    std::cout << "  \"" << text << "\"\n";
    auto instant = Instant::parse(text);
    if (!instant) {
        std::cout << "    error: " << instant.error().message() << "\n";
        return;
    }
    std::cout << "    canonical: " << *instant << "\n";
    if (auto utc = instant->with_offset(std::chrono::minutes::zero())) {
        std::cout << "    UTC: " << *utc << "\n";
    }
    std::cout << "    unix seconds: " << instant->unix_seconds()
              << (instant->is_leap_second() ? " (leap second)" : "") << "\n";
}

int main() {
    // SPDLOG_LEVEL=tempo=debug shows why inputs were rejected
    spdlog::cfg::load_env_levels();

    std::cout << "TEMPO Period and Instant Examples\n";
    std::cout << "=================================\n\n";

    // Example 1: Periods
    std::cout << "1. Parsing Periods\n";
    std::cout << "------------------\n";
    for (const char* text : {"1 week", "2 years 18 Weeks 4 dy 12 hrs 0.000456 SEC",
                             "600millisecond25usecs100nanos", "1w1.23s", "1.23s456ns"}) {
        printPeriod(text);
    }
    std::cout << "\n";

    // Example 2: Instants
    std::cout << "2. Parsing Instants\n";
    std::cout << "-------------------\n";
    for (const char* text : {"2018-10-11T03:23:38Z", "20181011 0323", "2018-10-11T03:23:38-08:00",
                             "20150218 235960,234567 −05", "boo"}) {
        printInstant(text);
    }
    std::cout << "\n";

    // Example 3: Ordering is by absolute time, whatever the offset
    std::cout << "3. Sorting Instants\n";
    std::cout << "-------------------\n";
    std::vector<Instant> instants;
    for (const char* text : {"2018-10-11T03:23:39-08:00", "2018-10-11T03:23:39+11:00",
                             "2018-10-11 03:23:40"}) {
        if (auto instant = Instant::parse(text)) {
            instants.push_back(*instant);
        }
    }
    std::sort(instants.begin(), instants.end());
    for (const auto& instant : instants) {
        std::cout << "  " << instant << "\n";
    }
    std::cout << "\n";

    // Example 4: JSON scalars
    std::cout << "4. JSON\n";
    std::cout << "-------\n";
    std::cout << "  " << to_json(sample_instant()) << "\n";
    auto timeout = from_json<Period>("\"1m30s\"");
    if (timeout) {
        std::cout << "  " << to_json(*timeout) << " -> " << Timeout::from_period(*timeout).milliseconds()
                  << " ms\n";
    } else {
        std::cout << "  error: " << timeout.error().message() << "\n";
    }

    return 0;
}
