#include "patterns/PatternSource.hpp"

#include "util/Logger.hpp"
#include "util/SecureRandom.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <format>
#include <string>

namespace patterns {

namespace {

struct NamedStandard {
    std::string_view name;
    Standard standard;
};

constexpr std::array<NamedStandard, 10> STANDARD_NAMES{{
    {"zero-fill", Standard::ZERO_FILL},
    {"one-fill", Standard::ONE_FILL},
    {"random", Standard::RANDOM},
    {"dod-3", Standard::DOD_3},
    {"gutmann-35", Standard::GUTMANN_35},
    {"custom", Standard::CUSTOM},
    {"classic", Standard::CLASSIC},
    {"schneier-7", Standard::SCHNEIER_7},
    {"vsitr-7", Standard::VSITR_7},
    {"gost-2", Standard::GOST_2},
}};

auto check_pass_count(int pass_count) -> std::expected<void, util::Error> {
    if (pass_count < PatternSource::MIN_PASSES || pass_count > PatternSource::MAX_PASSES) {
        return util::fail(ErrorKind::INVALID_PASS_COUNT,
                          std::format("Pass count {} outside [{}, {}]", pass_count,
                                      PatternSource::MIN_PASSES, PatternSource::MAX_PASSES));
    }
    return {};
}

void random_passes(std::vector<PassSpec>& passes, int count, std::string_view label) {
    for (int i = 0; i < count; ++i) {
        passes.push_back(PassSpec::random(std::format("{} random {}", label, i + 1)));
    }
}

// Gutmann, "Secure Deletion of Data from Magnetic and Solid-State Memory" (1996), table 3.
// The paper permutes passes 5-31 per run; the order here is fixed so results are auditable.
auto gutmann_passes() -> std::vector<PassSpec> {
    std::vector<PassSpec> passes;
    passes.reserve(35);

    random_passes(passes, 4, "Gutmann");

    passes.push_back(PassSpec::constant("Gutmann 0x55", 0x55));
    passes.push_back(PassSpec::constant("Gutmann 0xAA", 0xAA));
    passes.push_back(PassSpec::sequence("Gutmann 92 49 24", {0x92, 0x49, 0x24}));
    passes.push_back(PassSpec::sequence("Gutmann 49 24 92", {0x49, 0x24, 0x92}));
    passes.push_back(PassSpec::sequence("Gutmann 24 92 49", {0x24, 0x92, 0x49}));

    for (int value = 0x00; value <= 0xFF; value += 0x11) {
        passes.push_back(
            PassSpec::constant(std::format("Gutmann 0x{:02X}", value), static_cast<uint8_t>(value)));
    }

    passes.push_back(PassSpec::sequence("Gutmann 92 49 24 (2)", {0x92, 0x49, 0x24}));
    passes.push_back(PassSpec::sequence("Gutmann 49 24 92 (2)", {0x49, 0x24, 0x92}));
    passes.push_back(PassSpec::sequence("Gutmann 24 92 49 (2)", {0x24, 0x92, 0x49}));
    passes.push_back(PassSpec::sequence("Gutmann 6D B6 DB", {0x6D, 0xB6, 0xDB}));
    passes.push_back(PassSpec::sequence("Gutmann B6 DB 6D", {0xB6, 0xDB, 0x6D}));
    passes.push_back(PassSpec::sequence("Gutmann DB 6D B6", {0xDB, 0x6D, 0xB6}));

    for (int i = 0; i < 4; ++i) {
        passes.push_back(PassSpec::random(std::format("Gutmann random {}", i + 5)));
    }
    return passes;
}

auto random_constant_pass(std::string name) -> std::expected<PassSpec, util::Error> {
    std::array<uint8_t, 1> value{};
    if (auto filled = util::SecureRandom::fill(value); !filled) {
        return std::unexpected(filled.error());
    }
    return PassSpec::constant(std::move(name), value[0]);
}

// Rotation used by the legacy desktop shredder
auto classic_passes(int pass_count) -> std::expected<std::vector<PassSpec>, util::Error> {
    std::vector<PassSpec> passes;
    passes.reserve(static_cast<size_t>(pass_count));

    for (int i = 0; i < pass_count; ++i) {
        switch (i) {
            case 0:
                passes.push_back(PassSpec::constant("Classic 0x00", 0x00));
                break;
            case 1:
                passes.push_back(PassSpec::constant("Classic 0xFF", 0xFF));
                break;
            case 2:
                passes.push_back(PassSpec::constant("Classic 0xAA", 0xAA));
                break;
            case 3:
                passes.push_back(PassSpec::constant("Classic 0x55", 0x55));
                break;
            case 5:
                passes.push_back(PassSpec::random("Classic random stream"));
                break;
            case 6:
                passes.push_back(PassSpec::sequence("Classic DE AD BE EF", {0xDE, 0xAD, 0xBE, 0xEF}));
                break;
            default: {
                auto pass = random_constant_pass(std::format("Classic random byte {}", i + 1));
                if (!pass) {
                    return std::unexpected(pass.error());
                }
                passes.push_back(std::move(*pass));
                break;
            }
        }
    }
    return passes;
}

}  // namespace

auto PatternSource::resolve(const PatternRequest& request)
    -> std::expected<std::vector<PassSpec>, util::Error> {
    std::vector<PassSpec> passes;

    switch (request.standard) {
        case Standard::ZERO_FILL:
            passes.push_back(PassSpec::constant("Zero fill", 0x00));
            break;

        case Standard::ONE_FILL:
            passes.push_back(PassSpec::constant("One fill", 0xFF));
            break;

        case Standard::RANDOM:
            passes.push_back(PassSpec::random("Random"));
            break;

        case Standard::DOD_3:
            passes.push_back(PassSpec::constant("DoD 0x55", 0x55));
            passes.push_back(PassSpec::constant("DoD 0xAA", 0xAA));
            passes.push_back(PassSpec::random("DoD random"));
            break;

        case Standard::GUTMANN_35:
            passes = gutmann_passes();
            break;

        case Standard::CUSTOM: {
            if (auto valid = check_pass_count(request.pass_count); !valid) {
                return std::unexpected(valid.error());
            }
            if (request.custom_pattern.empty()) {
                return util::fail(ErrorKind::INVALID_PATTERN, "Custom pattern is empty");
            }
            for (int i = 0; i < request.pass_count; ++i) {
                passes.push_back(
                    PassSpec::sequence(std::format("Custom {}", i + 1), request.custom_pattern));
            }
            break;
        }

        case Standard::CLASSIC: {
            if (auto valid = check_pass_count(request.pass_count); !valid) {
                return std::unexpected(valid.error());
            }
            auto classic = classic_passes(request.pass_count);
            if (!classic) {
                return std::unexpected(classic.error());
            }
            passes = std::move(*classic);
            break;
        }

        case Standard::SCHNEIER_7:
            passes.push_back(PassSpec::constant("Schneier 0x00", 0x00));
            passes.push_back(PassSpec::constant("Schneier 0xFF", 0xFF));
            random_passes(passes, 5, "Schneier");
            break;

        case Standard::VSITR_7:
            for (int i = 0; i < 6; ++i) {
                const uint8_t value = (i % 2 == 0) ? 0x00 : 0xFF;
                passes.push_back(
                    PassSpec::constant(std::format("VSITR {} 0x{:02X}", i + 1, value), value));
            }
            passes.push_back(PassSpec::constant("VSITR 7 0xAA", 0xAA));
            break;

        case Standard::GOST_2:
            passes.push_back(PassSpec::constant("GOST 0x00", 0x00));
            passes.push_back(PassSpec::random("GOST random"));
            break;

        default:
            return util::fail(ErrorKind::UNKNOWN_STANDARD,
                              std::format("Unknown standard id {}",
                                          static_cast<int>(request.standard)));
    }

    LOG_DEBUG("PatternSource", std::format("Resolved {} to {} passes",
                                           standard_name(request.standard), passes.size()));
    return passes;
}

auto PatternSource::resolve_by_name(std::string_view name, std::vector<uint8_t> custom_pattern,
                                    int pass_count)
    -> std::expected<std::vector<PassSpec>, util::Error> {
    auto standard = parse_standard(name);
    if (!standard) {
        return std::unexpected(standard.error());
    }
    return resolve(PatternRequest{.standard = *standard,
                                  .custom_pattern = std::move(custom_pattern),
                                  .pass_count = pass_count});
}

auto PatternSource::parse_standard(std::string_view name) -> std::expected<Standard, util::Error> {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });

    auto it = std::ranges::find(STANDARD_NAMES, std::string_view{lowered}, &NamedStandard::name);
    if (it == STANDARD_NAMES.end()) {
        return util::fail(ErrorKind::UNKNOWN_STANDARD, std::format("Unknown standard '{}'", name));
    }
    return it->standard;
}

auto PatternSource::standard_name(Standard standard) -> std::string_view {
    auto it = std::ranges::find(STANDARD_NAMES, standard, &NamedStandard::standard);
    return it != STANDARD_NAMES.end() ? it->name : "unknown";
}

auto PatternSource::fill(const PassSpec& spec, std::span<uint8_t> buffer, uint64_t offset)
    -> std::expected<void, util::Error> {
    switch (spec.kind) {
        case PatternKind::CONSTANT:
            std::ranges::fill(buffer, spec.bytes.empty() ? uint8_t{0} : spec.bytes.front());
            return {};

        case PatternKind::SEQUENCE: {
            const size_t length = spec.bytes.size();
            if (length == 0) {
                return util::fail(ErrorKind::INVALID_PATTERN, "Sequence pass has no bytes");
            }
            size_t phase = static_cast<size_t>(offset % length);
            for (auto& byte : buffer) {
                byte = spec.bytes[phase];
                if (++phase == length) {
                    phase = 0;
                }
            }
            return {};
        }

        case PatternKind::RANDOM:
            return util::SecureRandom::fill(buffer);
    }
    return util::fail(ErrorKind::INVALID_PATTERN, "Unhandled pattern kind");
}

auto PatternSource::expected_byte(const PassSpec& spec, uint64_t offset) -> uint8_t {
    if (spec.bytes.empty()) {
        return 0;
    }
    return spec.bytes[static_cast<size_t>(offset % spec.bytes.size())];
}

}  // namespace patterns
