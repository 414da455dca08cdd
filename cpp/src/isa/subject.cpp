#include "frameisa/isa/subject.hpp"

#include <cstdio>

namespace frameisa::isa {
    namespace {
        [[nodiscard]] const char* catalog_name(u16 v) noexcept {
            switch (v) {
            case subjects::kNull.v: return "NULL";
            case subjects::kSelf.v: return "SELF";
            case subjects::kUser.v: return "USER";
            case subjects::kContext.v: return "CONTEXT";
            case subjects::kWeather.v: return "WEATHER";
            case subjects::kTime.v: return "TIME";
            case subjects::kDate.v: return "DATE";
            case subjects::kSchedule.v: return "SCHEDULE";
            case subjects::kHealth.v: return "HEALTH";
            case subjects::kHelp.v: return "HELP";
            case subjects::kTimezone.v: return "TIMEZONE";
            case subjects::kNumber.v: return "NUMBER";
            case subjects::kEquation.v: return "EQUATION";
            case subjects::kPhysics.v: return "PHYSICS";
            case subjects::kChemistry.v: return "CHEMISTRY";
            case subjects::kComputer.v: return "COMPUTER";
            case subjects::kSoftware.v: return "SOFTWARE";
            case subjects::kHardware.v: return "HARDWARE";
            case subjects::kAi.v: return "AI";
            case subjects::kApi.v: return "API";
            case subjects::kDocumentation.v: return "DOCUMENTATION";
            case subjects::kConcept.v: return "CONCEPT";
            case subjects::kFeelings.v: return "FEELINGS";
            case subjects::kStress.v: return "STRESS";
            case subjects::kAnxiety.v: return "ANXIETY";
            default:
                return nullptr;
            }
        }
    } // namespace

    const char* subject_name(Subject s) noexcept {
        const char* named = catalog_name(s.v);
        if (named != nullptr) return named;
        if (s.is_rag_reference()) return "RAG_REF";
        if (s.is_trm_reference()) return "TRM_REF";
        return "UNKNOWN";
    }

    std::string subject_to_string(Subject s) {
        char buf[64]{};
        if (s.is_rag_reference()) {
            std::snprintf(buf, sizeof(buf), "SUBJ(RAG:0x%04X)", static_cast<unsigned>(s.v));
        } else if (s.is_trm_reference()) {
            std::snprintf(buf, sizeof(buf), "SUBJ(TRM:0x%02X)", static_cast<unsigned>(s.v - kTrmRefStart));
        } else {
            std::snprintf(buf, sizeof(buf), "SUBJ(0x%04X:%s)", static_cast<unsigned>(s.v), subject_name(s));
        }
        return std::string(buf);
    }
} // namespace frameisa::isa
