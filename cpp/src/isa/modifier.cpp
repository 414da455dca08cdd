#include "frameisa/isa/modifier.hpp"

#include <cstdio>

namespace frameisa::isa {
    const char* voice_name(Voice x) noexcept {
        switch (x) {
        case Voice::Neutral: return "Neutral";
        case Voice::Formal: return "Formal";
        case Voice::Casual: return "Casual";
        case Voice::Technical: return "Technical";
        }
        return "Unknown";
    }

    const char* tone_name(Tone x) noexcept {
        switch (x) {
        case Tone::Neutral: return "Neutral";
        case Tone::Positive: return "Positive";
        case Tone::Empathetic: return "Empathetic";
        case Tone::Cautious: return "Cautious";
        }
        return "Unknown";
    }

    const char* warmth_name(Warmth x) noexcept {
        switch (x) {
        case Warmth::Cold: return "Cold";
        case Warmth::Neutral: return "Neutral";
        case Warmth::Warm: return "Warm";
        case Warmth::VeryWarm: return "VeryWarm";
        }
        return "Unknown";
    }

    const char* format_name(Format x) noexcept {
        switch (x) {
        case Format::Prose: return "Prose";
        case Format::Bulleted: return "Bulleted";
        case Format::Numbered: return "Numbered";
        case Format::Structured: return "Structured";
        }
        return "Unknown";
    }

    const char* accuracy_name(Accuracy x) noexcept {
        switch (x) {
        case Accuracy::Low: return "Low";
        case Accuracy::Medium: return "Medium";
        case Accuracy::High: return "High";
        case Accuracy::Verified: return "Verified";
        }
        return "Unknown";
    }

    const char* urgency_name(Urgency x) noexcept {
        switch (x) {
        case Urgency::Low: return "Low";
        case Urgency::Normal: return "Normal";
        case Urgency::High: return "High";
        case Urgency::Critical: return "Critical";
        }
        return "Unknown";
    }

    std::string modifier_to_string(Modifier m) {
        char buf[96]{};
        std::snprintf(buf, sizeof(buf), "MOD(0x%04X: %s/%s/%s/%s)",
                      static_cast<unsigned>(m.v),
                      voice_name(m.voice()),
                      tone_name(m.tone()),
                      warmth_name(m.warmth()),
                      format_name(m.format()));
        return std::string(buf);
    }
} // namespace frameisa::isa
