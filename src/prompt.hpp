#pragma once
#include "store/conversation_store.hpp"
#include <string>
#include <vector>

namespace sandlot {

// System prompt for the analysis agent: the four data primitives, the
// language subset, result-shape guidance, then the dataset schema context.
std::string build_system_prompt(const std::string& schema_context);

// Prior messages as "Role: content" paragraphs followed by "User: <message>".
// A trailing history entry equal to the new message is dropped; with no
// history the message is returned as is.
std::string build_prompt_with_history(const std::string& user_message,
                                      const std::vector<StoredMessage>& history);

// Conversation title derived from the first user message.
std::string conversation_title(const std::string& user_message);

} // namespace sandlot
