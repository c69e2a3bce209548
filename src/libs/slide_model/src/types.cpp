#include <slide_model/types.hpp>

namespace slide_model {

const char* block_kind_name(BlockKind kind) {
    switch (kind) {
    case BlockKind::Text: return "text";
    case BlockKind::Image: return "image";
    case BlockKind::Question: return "question";
    case BlockKind::Graph: return "graph";
    case BlockKind::FeedbackQuestion: return "feedback-question";
    case BlockKind::AiChat: return "ai-chat";
    case BlockKind::Unknown: break;
    }
    return "unknown";
}

BlockKind block_kind_from_string(const std::string& s) {
    if (s == "text") return BlockKind::Text;
    if (s == "image") return BlockKind::Image;
    if (s == "question") return BlockKind::Question;
    if (s == "graph") return BlockKind::Graph;
    if (s == "feedback-question") return BlockKind::FeedbackQuestion;
    if (s == "ai-chat") return BlockKind::AiChat;
    return BlockKind::Unknown;
}

const char* display_mode_name(DisplayMode mode) {
    switch (mode) {
    case DisplayMode::All: break;
    case DisplayMode::Question: return "question";
    case DisplayMode::Image: return "image";
    case DisplayMode::Feedback: return "feedback";
    }
    return "all";
}

DisplayMode display_mode_from_string(const std::string& s) {
    if (s == "question") return DisplayMode::Question;
    if (s == "image") return DisplayMode::Image;
    if (s == "feedback") return DisplayMode::Feedback;
    return DisplayMode::All;
}

} // namespace slide_model
