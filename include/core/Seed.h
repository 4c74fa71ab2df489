#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Startup data from SEATPOOL_SEED_TEAMS and SEATPOOL_SEED_CODES.
 *
 * Both are comma-separated lists of colon-separated fields.
 */
namespace Seed {
    struct TeamSeed {
        uint32_t id;
        uint32_t capacity;
        uint32_t groupId;
    };

    struct CodeSeed {
        std::string code;
        uint32_t maxUses; // 0 = unlimited
        uint32_t groupId;
    };

    namespace detail {
        inline std::vector<std::string> split(const std::string &text, const char sep) {
            std::vector<std::string> parts;
            std::stringstream stream(text);
            std::string part;
            while (std::getline(stream, part, sep)) {
                if (!part.empty()) parts.push_back(part);
            }
            return parts;
        }

        inline uint32_t number(const std::string &field, const std::string &entry) {
            if (field.empty() || field.find_first_not_of("0123456789") != std::string::npos) {
                throw std::runtime_error("Invalid seed entry: " + entry);
            }
            return static_cast<uint32_t>(std::stoul(field));
        }
    }

    /** @throws std::runtime_error On a malformed "id:capacity:group" entry */
    inline std::vector<TeamSeed> parseTeams(const std::string &text) {
        std::vector<TeamSeed> teams;
        for (const auto &entry: detail::split(text, ',')) {
            const auto fields = detail::split(entry, ':');
            if (fields.size() != 3) throw std::runtime_error("Invalid seed entry: " + entry);
            const uint32_t id = detail::number(fields[0], entry);
            if (id == 0) throw std::runtime_error("Team id 0 is reserved: " + entry);
            teams.push_back({id, detail::number(fields[1], entry), detail::number(fields[2], entry)});
        }
        return teams;
    }

    /** @throws std::runtime_error On a malformed "code:max_uses:group" entry */
    inline std::vector<CodeSeed> parseCodes(const std::string &text) {
        std::vector<CodeSeed> codes;
        for (const auto &entry: detail::split(text, ',')) {
            const auto fields = detail::split(entry, ':');
            if (fields.size() != 3) throw std::runtime_error("Invalid seed entry: " + entry);
            codes.push_back({fields[0], detail::number(fields[1], entry), detail::number(fields[2], entry)});
        }
        return codes;
    }
}
