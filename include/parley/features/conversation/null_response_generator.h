#ifndef PARLEY_FEATURES_CONVERSATION_NULL_RESPONSE_GENERATOR_H
#define PARLEY_FEATURES_CONVERSATION_NULL_RESPONSE_GENERATOR_H

#include "parley/features/conversation/capabilities.h"

namespace parley {

// Speech-only mode: every turn ends after transcription with nothing to say
class NullResponseGenerator : public IResponseGenerator {
   public:
    ErrorCode initialize(const std::string&) override { return ErrorCode::Success; }

    ErrorCode generate(const std::string&, std::string& out_text) override {
        out_text.clear();
        return ErrorCode::Success;
    }

    void set_system_prompt(const std::string&) override {}
    void clear_history() override {}
    ErrorCode shutdown() override { return ErrorCode::Success; }
};

}  // namespace parley

#endif  // PARLEY_FEATURES_CONVERSATION_NULL_RESPONSE_GENERATOR_H
