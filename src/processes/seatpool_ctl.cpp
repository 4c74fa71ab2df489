#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>
#include <unistd.h>

#include "core/Config.h"
#include "core/Errors.h"
#include "logging/Logger.h"
#include "service/SeatpoolNode.h"
#include "utils/ArgumentParser.h"
#include "utils/TimeHelper.h"

namespace {
    constexpr auto TAG = "seatpool_ctl";
    constexpr auto SRC = Logger::Source::Client;

    // Exit codes, one per outcome a caller may want to script against
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_USAGE = 1;
    constexpr int EXIT_REJECTED = 2; // invalid code, throttled, full queue
    constexpr int EXIT_UNAVAILABLE = 3; // coordination or membership service down
    constexpr int EXIT_ERROR = 4;

    void usage(const char *program) {
        fprintf(stderr,
                "Usage: %s <command> [args]\n"
                "  enqueue <identity> <code> [group]\n"
                "  redeem <identity> <code> [group]\n"
                "  capacity [group]\n"
                "  depth\n"
                "  status <handle>\n"
                "  team <id> <capacity> <group> [health]\n"
                "  code <code> <max_uses> [group] [ttl_sec]\n"
                "  confirm <team> <identity>\n"
                "  remove <team> <identity>\n"
                "  health <team> <active|banned|token_invalid|paused>\n",
                program);
    }

    bool parseHealth(const char *text, TeamHealth &out) {
        for (const auto health: {TeamHealth::ACTIVE, TeamHealth::BANNED, TeamHealth::TOKEN_INVALID,
                                 TeamHealth::PAUSED}) {
            if (strcmp(text, toString(health)) == 0) {
                out = health;
                return true;
            }
        }
        return false;
    }

    /** Optional numeric operand at argv[index], defaultValue when absent. */
    bool optionalUint(const int argc, char *argv[], const int index, uint32_t defaultValue, uint32_t &out) {
        if (index >= argc) {
            out = defaultValue;
            return true;
        }
        return ArgumentParser::parseUint32(argv[index], out);
    }

    void printCapacity(SeatpoolNode &node, const uint32_t groupId) {
        const time_t now = time(nullptr);
        const auto summary = node.service().getCapacity(groupId);
        printf("group=%u teams=%u capacity=%u confirmed=%u pending=%u available=%u\n", groupId, summary.teams,
               summary.capacity, summary.confirmed, summary.pending, summary.available);
        for (const auto &team: node.ledger().listCapacities(groupId, false, now)) {
            printf("  team=%u group=%u health=%s capacity=%u confirmed=%u pending=%u available=%u\n", team.teamId,
                   team.groupId, toString(team.health), team.capacity, team.confirmed, team.pending, team.available);
        }
    }

    void printDepth(SeatpoolNode &node) {
        const auto depth = node.service().getQueueDepth();
        printf("queued=%u delayed=%u\n", depth.queued, depth.delayed);
        for (uint8_t s = 0; s < 5; ++s) {
            printf("  invite %-8s %u\n", toString(static_cast<InviteStatus>(s)), depth.store.invites[s]);
        }
        for (uint8_t s = 0; s < 4; ++s) {
            printf("  waiting %-8s %u\n", toString(static_cast<WaitingStatus>(s)), depth.store.waiting[s]);
        }
    }

    int printStatus(SeatpoolNode &node, const uint32_t handle) {
        const auto invite = node.service().inviteStatus(handle);
        if (!invite) {
            printf("handle %u not found\n", handle);
            return EXIT_ERROR;
        }
        char updated[32];
        TimeHelper::formatTimestamp(invite->updatedAt, updated, sizeof(updated));
        printf("handle=%u identity=%s code=%s status=%s team=%u updated=%s note=%s\n", invite->id, invite->identity,
               invite->code, toString(invite->status), invite->teamId, updated, invite->note);
        return EXIT_OK;
    }

    int run(SeatpoolNode &node, const int argc, char *argv[]) {
        const std::string command = argv[1];
        const time_t now = time(nullptr);

        if ((command == "enqueue" || command == "redeem") && (argc == 4 || argc == 5)) {
            uint32_t group;
            if (!optionalUint(argc, argv, 4, 0, group)) return EXIT_USAGE;
            if (command == "enqueue") {
                printf("handle=%u\n", node.service().enqueueInvite(argv[2], argv[3], group));
            } else {
                const auto result = node.service().reserveSeat(argv[2], argv[3], group);
                printf("ok=%d team=%u handle=%u waiting=%u\n", result.ok, result.teamId, result.inviteId,
                       result.waitingId);
            }
            return EXIT_OK;
        }
        if (command == "capacity" && argc <= 3) {
            uint32_t group;
            if (!optionalUint(argc, argv, 2, 0, group)) return EXIT_USAGE;
            printCapacity(node, group);
            return EXIT_OK;
        }
        if (command == "depth" && argc == 2) {
            printDepth(node);
            return EXIT_OK;
        }
        if (command == "status" && argc == 3) {
            uint32_t handle;
            if (!ArgumentParser::parseUint32(argv[2], handle)) return EXIT_USAGE;
            return printStatus(node, handle);
        }
        if (command == "team" && (argc == 5 || argc == 6)) {
            uint32_t id, capacity, group;
            TeamHealth health{TeamHealth::ACTIVE};
            if (!ArgumentParser::parseUint32(argv[2], id) || id == 0 ||
                !ArgumentParser::parseUint32(argv[3], capacity) ||
                !ArgumentParser::parseUint32(argv[4], group) ||
                (argc == 6 && !parseHealth(argv[5], health))) {
                return EXIT_USAGE;
            }
            node.store().upsertTeam(id, capacity, group, health, "team-" + std::to_string(id));
            printf("team %u: capacity=%u group=%u health=%s\n", id, capacity, group, toString(health));
            return EXIT_OK;
        }
        if (command == "code" && argc >= 4 && argc <= 6) {
            uint32_t maxUses, group, ttl;
            if (!ArgumentParser::parseUint32(argv[3], maxUses) || !optionalUint(argc, argv, 4, 0, group) ||
                !optionalUint(argc, argv, 5, 0, ttl)) {
                return EXIT_USAGE;
            }
            node.store().upsertCode(argv[2], maxUses, group, ttl > 0 ? now + ttl : 0, true);
            if (const auto row = node.store().code(argv[2])) {
                node.bucket().rebuild(*row);
            }
            printf("code %s: max_uses=%u group=%u\n", argv[2], maxUses, group);
            return EXIT_OK;
        }
        if ((command == "confirm" || command == "remove") && argc == 4) {
            uint32_t team;
            if (!ArgumentParser::parseUint32(argv[2], team)) return EXIT_USAGE;
            if (command == "confirm") {
                const bool added = node.store().addMember(team, argv[3]);
                printf("%s\n", added ? "confirmed" : "already a member");
            } else {
                node.service().removeMember(team, argv[3]);
                printf("removed\n");
            }
            return EXIT_OK;
        }
        if (command == "health" && argc == 4) {
            uint32_t team;
            TeamHealth health;
            if (!ArgumentParser::parseUint32(argv[2], team) || !parseHealth(argv[3], health)) return EXIT_USAGE;
            if (!node.store().setTeamHealth(team, health)) {
                printf("team %u not found\n", team);
                return EXIT_ERROR;
            }
            printf("team %u: health=%s\n", team, toString(health));
            return EXIT_OK;
        }
        return EXIT_USAGE;
    }
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return EXIT_USAGE;
    }

    int code;
    try {
        Config::loadEnvFile();
        const IpcKeys keys = IpcKeys::standard();
        Logger::initCentralized(keys.shm, keys.sem, keys.logQueue);
        SeatpoolNode node(keys, SRC);
        code = run(node, argc, argv);
    } catch (const invalid_code &e) {
        fprintf(stderr, "invalid_code: %s\n", e.what());
        code = EXIT_REJECTED;
    } catch (const throttled &e) {
        fprintf(stderr, "throttled: %s\n", e.what());
        code = EXIT_REJECTED;
    } catch (const queue_full &e) {
        fprintf(stderr, "queue_full: %s\n", e.what());
        code = EXIT_REJECTED;
    } catch (const coordination_unavailable &e) {
        fprintf(stderr, "coordination_unavailable: %s\n", e.what());
        code = EXIT_UNAVAILABLE;
    } catch (const membership_error &e) {
        fprintf(stderr, "membership_error: %s\n", e.what());
        code = EXIT_UNAVAILABLE;
    } catch (const std::exception &e) {
        Logger::error(SRC, TAG, "Exception: %s", e.what());
        code = EXIT_ERROR;
    }
    Logger::cleanupCentralized();

    if (code == EXIT_USAGE) usage(argv[0]);
    return code;
}
