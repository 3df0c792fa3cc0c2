#include "Events.h"

#include "Digest.h"

#include <cmath>
#include <iomanip>
#include <ostream>

namespace ringsim {

const char* toString(EventType t) {
    switch (t) {
        case EventType::FightStart:     return "FIGHT_START";
        case EventType::RoundStart:     return "ROUND_START";
        case EventType::RoundEnd:       return "ROUND_END";
        case EventType::Tick:           return "TICK";
        case EventType::PunchLanded:    return "PUNCH_LANDED";
        case EventType::Knockdown:      return "KNOCKDOWN";
        case EventType::FlashKnockdown: return "FLASH_KNOCKDOWN";
        case EventType::Count:          return "COUNT";
        case EventType::Recovery:       return "RECOVERY";
        case EventType::Hurt:           return "HURT";
        case EventType::Buzzed:         return "BUZZED";
        case EventType::Cut:            return "CUT";
        case EventType::Foul:           return "FOUL";
        case EventType::PointDeduction: return "POINT_DEDUCTION";
        case EventType::RefereeCommand: return "REFEREE_COMMAND";
        case EventType::Intimidation:   return "INTIMIDATION";
        case EventType::BigFight:       return "BIG_FIGHT";
        case EventType::FastStart:      return "FAST_START";
        case EventType::FightEnding:    return "FIGHT_ENDING";
        case EventType::FightEnd:       return "FIGHT_END";
    }
    return "UNKNOWN";
}

FighterSnapshot snapshotOf(const Fighter& f, double x_ft, double y_ft, double momentum) {
    FighterSnapshot s;
    s.name = f.name();
    s.state = f.state();
    s.subState = f.subState();
    s.stamina = f.stamina();
    s.maxStamina = f.maxStamina();
    s.staminaPercent = f.getStaminaPercent();
    s.staminaTier = f.getStaminaTier();
    s.headDamage = f.headDamage();
    s.bodyDamage = f.bodyDamage();
    s.headDamagePercent = f.getHeadDamagePercent();
    s.bodyDamagePercent = f.getBodyDamagePercent();
    s.knockdownsRound = f.knockdownsThisRound();
    s.knockdownsTotal = f.knockdownsTotal();
    s.isHurt = f.isHurt();
    s.isBuzzed = f.isBuzzed();
    s.buzzedSeverity = f.buzzedSeverity();
    s.isStunned = f.isStunned();
    s.stunLevel = f.stunLevel();
    s.cuts = static_cast<int>(f.cuts().size());
    s.swelling = static_cast<int>(f.swelling().size());
    s.x_ft = x_ft;
    s.y_ft = y_ft;
    s.momentum = momentum;
    s.punchesThrown = f.fightStats().punchesThrown;
    s.punchesLanded = f.fightStats().punchesLanded;
    s.damageDealt = f.fightStats().damageDealt;
    return s;
}

// ============================================================
// Event digest
//
// Floats are folded as float32 so the CRC is insensitive to the last bits
// of double arithmetic that never reach a log line.
// ============================================================

namespace {

std::uint32_t crcAddSnapshot(std::uint32_t crc, const FighterSnapshot& s) {
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(s.state));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(s.subState));
    crc = digest::crc32_add_f32(crc, static_cast<float>(s.stamina));
    crc = digest::crc32_add_f32(crc, static_cast<float>(s.headDamage));
    crc = digest::crc32_add_f32(crc, static_cast<float>(s.bodyDamage));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(s.knockdownsTotal));
    crc = digest::crc32_add_u32(crc, (s.isHurt ? 1u : 0u) | (s.isBuzzed ? 2u : 0u) | (s.isStunned ? 4u : 0u));
    crc = digest::crc32_add_f32(crc, static_cast<float>(s.x_ft));
    crc = digest::crc32_add_f32(crc, static_cast<float>(s.y_ft));
    return crc;
}

} // namespace

std::uint32_t crc32AddEvent(std::uint32_t crc, const FightEvent& e) {
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.type));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.round));
    crc = digest::crc32_add_f32(crc, static_cast<float>(e.roundTime_s));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.side));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.other));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.punch));
    crc = digest::crc32_add_f32(crc, static_cast<float>(e.damage));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.count));
    crc = digest::crc32_add_u32(crc, e.isKO ? 1u : 0u);
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.severity));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.consequence));
    crc = digest::crc32_add_u32(crc, static_cast<std::uint32_t>(e.method));
    if (!e.text.empty()) {
        crc = digest::crc32_update(crc, e.text.data(), e.text.size());
    }
    if (e.hasFighters) {
        crc = crcAddSnapshot(crc, e.fighters[0]);
        crc = crcAddSnapshot(crc, e.fighters[1]);
    }
    return crc;
}

int EventRecorder::countOf(EventType t) const {
    int n = 0;
    for (const auto& e : events_) {
        if (e.type == t) ++n;
    }
    return n;
}

// ============================================================
// StreamEventLogger
// ============================================================

void StreamEventLogger::setNames(const std::string& a, const std::string& b) {
    names_[0] = a;
    names_[1] = b;
}

void StreamEventLogger::onEvent(const FightEvent& e) {
    if (e.type == EventType::Tick && !verbose_) return;

    const int minutes = static_cast<int>(e.roundTime_s) / 60;
    const double seconds = e.roundTime_s - minutes * 60.0;

    os_ << "[R" << e.round << " " << minutes << ":" << std::setw(4) << std::setfill('0')
        << std::fixed << std::setprecision(1) << seconds << std::setfill(' ') << "] "
        << toString(e.type);

    switch (e.type) {
        case EventType::FightStart:
            os_ << " " << label(Side::A) << " vs " << label(Side::B) << " (" << e.count << " rounds, "
                << e.text << ")";
            break;
        case EventType::RoundStart:
            break;
        case EventType::RoundEnd:
            for (const auto& s : e.scorecards) {
                os_ << " " << s.judge << " " << s.a << "-" << s.b;
            }
            break;
        case EventType::Tick:
            os_ << std::setprecision(2) << " dist=" << e.distance_ft;
            for (Side s : {Side::A, Side::B}) {
                const FighterSnapshot& f = e.fighters[sideIndex(s)];
                os_ << " " << label(s) << "[" << toString(f.state) << " sta=" << f.staminaPercent
                    << " head=" << f.headDamagePercent << "]";
            }
            break;
        case EventType::PunchLanded:
            os_ << " " << label(e.side) << " -> " << label(e.other) << " " << toString(e.punch) << " "
                << toString(e.location) << " dmg=" << std::setprecision(0) << e.damage << " "
                << toString(e.quality) << (e.isCounter ? " counter" : "");
            break;
        case EventType::Knockdown:
        case EventType::FlashKnockdown:
            os_ << " " << label(e.side) << " dropped by " << label(e.other) << " " << toString(e.punch);
            break;
        case EventType::Count:
            os_ << " " << label(e.side) << " " << e.count << (e.isKO ? " OUT" : "");
            break;
        case EventType::Recovery:
            os_ << " " << label(e.side) << " up at " << e.count;
            break;
        case EventType::Hurt:
            os_ << " " << label(e.side) << " for " << e.duration_s << "s";
            break;
        case EventType::Buzzed:
            os_ << " " << label(e.side) << " severity " << e.severity << " for " << e.duration_s << " ticks";
            break;
        case EventType::Cut:
            os_ << " " << label(e.side) << " " << e.text << " severity " << e.severity;
            break;
        case EventType::Foul:
            os_ << " " << label(e.side) << " on " << label(e.other) << " " << toString(e.foul)
                << (e.detected ? " seen " : " unseen ") << toString(e.consequence);
            break;
        case EventType::PointDeduction:
            os_ << " " << label(e.side) << " " << e.text << " (total " << e.count << ")";
            break;
        case EventType::RefereeCommand:
            os_ << " " << e.detail << " \"" << e.text << "\"";
            break;
        case EventType::Intimidation:
            os_ << " " << label(e.side) << " unsettled by " << label(e.other);
            break;
        case EventType::BigFight:
        case EventType::FastStart:
            os_ << " " << label(e.side);
            break;
        case EventType::FightEnding:
        case EventType::FightEnd:
            if (e.hasWinner) {
                os_ << " " << label(e.winner) << " by " << toString(e.method);
            } else {
                os_ << " " << toString(e.method);
            }
            if (e.type == EventType::FightEnd) {
                os_ << " in round " << e.round;
                for (const auto& s : e.scorecards) {
                    os_ << " " << s.judge << " " << s.a << "-" << s.b;
                }
            }
            break;
    }
    os_ << "\n";
}

} // namespace ringsim
