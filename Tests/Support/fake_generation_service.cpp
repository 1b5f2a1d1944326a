#include "Support/fake_generation_service.h"

#include <stdexcept>

namespace rc::test {

std::optional<QString> FakeGenerationService::complete(const QString& prompt,
                                                       const GenerationOptions& options)
{
    m_prompts.append(prompt);
    m_lastOptions = options;

    if (m_throw) {
        throw std::runtime_error("generation backend crashed");
    }

    if (m_replies.empty()) {
        return m_defaultReply;
    }
    std::optional<QString> reply = std::move(m_replies.front());
    m_replies.pop_front();
    return reply;
}

} // namespace rc::test
