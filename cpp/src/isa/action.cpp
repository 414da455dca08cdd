#include "frameisa/isa/action.hpp"

#include <cstdio>

namespace frameisa::isa {
    const char* action_name(Action a) noexcept {
        switch (a.v) {
        case actions::kNop.v: return "NOP";
        case actions::kHalt.v: return "HALT";
        case actions::kError.v: return "ERROR";
        case actions::kStatus.v: return "STATUS";
        case actions::kGreet.v: return "GREET";
        case actions::kConfirm.v: return "CONFIRM";
        case actions::kDeny.v: return "DENY";
        case actions::kExplain.v: return "EXPLAIN";
        case actions::kClarify.v: return "CLARIFY";
        case actions::kApologize.v: return "APOLOGIZE";
        case actions::kThank.v: return "THANK";
        case actions::kRespond.v: return "RESPOND";
        case actions::kAsk.v: return "ASK";
        case actions::kRequest.v: return "REQUEST";
        case actions::kSearch.v: return "SEARCH";
        case actions::kRetrieve.v: return "RETRIEVE";
        case actions::kDefine.v: return "DEFINE";
        case actions::kDescribe.v: return "DESCRIBE";
        case actions::kCompare.v: return "COMPARE";
        case actions::kSummarize.v: return "SUMMARIZE";
        case actions::kExplainHow.v: return "EXPLAIN_HOW";
        case actions::kExplainWhy.v: return "EXPLAIN_WHY";
        case actions::kCalculate.v: return "CALCULATE";
        case actions::kSetTimer.v: return "SET_TIMER";
        case actions::kKnowledgeSearch.v: return "KNOWLEDGE_SEARCH";
        case actions::kEmpathy.v: return "EMPATHY";
        case actions::kConcern.v: return "CONCERN";
        case actions::kEncouragement.v: return "ENCOURAGEMENT";
        case actions::kReassure.v: return "REASSURE";
        case actions::kTemplateLoad.v: return "TEMPLATE_LOAD";
        case actions::kTemplateFill.v: return "TEMPLATE_FILL";
        case actions::kChain.v: return "CHAIN";
        case actions::kFork.v: return "FORK";
        case actions::kMerge.v: return "MERGE";
        default:
            return "UNKNOWN";
        }
    }

    std::string action_to_string(Action a) {
        char buf[64]{};
        std::snprintf(buf, sizeof(buf), "ACT(0x%04X:%s)", static_cast<unsigned>(a.v), action_name(a));
        return std::string(buf);
    }
} // namespace frameisa::isa
