#include <convoflow/core/transcript.hpp>
#include <gtest/gtest.h>

using namespace convoflow;

namespace {

std::vector<ConversationMessage> tool_exchange() {
    Json params = Json::object();
    params["command"] = "cargo test";

    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::user("Run the tests"));

    ConversationMessage call;
    call.role = MessageRole::ASSISTANT;
    call.content.push_back(ContentBlock::make_text("Running them now."));
    call.content.push_back(ContentBlock::make_tool_use(ToolCall("Bash", "toolu_1", params)));
    messages.push_back(call);

    ConversationMessage result;
    result.role = MessageRole::USER;
    result.content.push_back(ContentBlock::make_tool_result(ToolResult("toolu_1", false, "2 tests failed")));
    messages.push_back(result);

    messages.push_back(ConversationMessage::assistant("Two tests fail."));
    return messages;
}

} // namespace

TEST(TranscriptTest, EnvelopeShape) {
    Json env = message_to_envelope(ConversationMessage::user("hi"));
    EXPECT_EQ("user", env["type"].get<std::string>());
    EXPECT_EQ("user", env["message"]["role"].get<std::string>());
    ASSERT_TRUE(env["message"]["content"].is_array());
    EXPECT_EQ("text", env["message"]["content"][0]["type"].get<std::string>());
    EXPECT_EQ("hi", env["message"]["content"][0]["text"].get<std::string>());
}

TEST(TranscriptTest, ToolExchangeSurvivesEnvelopes) {
    std::vector<ConversationMessage> original = tool_exchange();
    std::vector<Json> envelopes = messages_to_envelopes(original);
    ASSERT_EQ(4u, envelopes.size());

    ParseResult parsed = parse_envelopes(envelopes);
    ASSERT_TRUE(parsed.success) << parsed.error;
    EXPECT_EQ(0u, parsed.dropped);
    ASSERT_EQ(4u, parsed.messages.size());

    const ContentBlock& use = parsed.messages[1].content[1];
    EXPECT_EQ(ContentType::TOOL_USE, use.type);
    EXPECT_EQ("toolu_1", use.id);
    EXPECT_EQ("Bash", use.name);
    EXPECT_EQ("cargo test", use.input["command"].get<std::string>());

    const ContentBlock& res = parsed.messages[2].content[0];
    EXPECT_EQ(ContentType::TOOL_RESULT, res.type);
    EXPECT_EQ("toolu_1", res.id);
    EXPECT_EQ("2 tests failed", res.text);
    EXPECT_TRUE(res.is_error);
}

TEST(TranscriptTest, SystemMessagesAreNotWritten) {
    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::system("be brief"));
    messages.push_back(ConversationMessage::user("hi"));
    EXPECT_EQ(1u, messages_to_envelopes(messages).size());
}

TEST(TranscriptTest, ReadsStringContentAndBareMessages) {
    std::vector<Json> envelopes;
    envelopes.push_back(Json::parse(R"({"type":"user","message":{"role":"user","content":"plain string"}})"));
    envelopes.push_back(Json::parse(R"({"role":"assistant","content":"bare message"})"));

    ParseResult parsed = parse_envelopes(envelopes);
    ASSERT_TRUE(parsed.success);
    ASSERT_EQ(2u, parsed.messages.size());
    EXPECT_EQ("plain string", parsed.messages[0].text());
    EXPECT_EQ(MessageRole::ASSISTANT, parsed.messages[1].role);
    EXPECT_EQ("bare message", parsed.messages[1].text());
}

TEST(TranscriptTest, ThinkingBlocksAreSkipped) {
    ConversationMessage out;
    Json env = Json::parse(R"({"type":"assistant","message":{"role":"assistant","content":[
        {"type":"thinking","thinking":"let me see"},
        {"type":"text","text":"Answer"}]}})");
    ASSERT_TRUE(envelope_to_message(env, out));
    ASSERT_EQ(1u, out.content.size());
    EXPECT_EQ("Answer", out.text());

    Json only_thinking = Json::parse(R"({"type":"assistant","message":{"role":"assistant","content":[
        {"type":"thinking","thinking":"hmm"}]}})");
    EXPECT_FALSE(envelope_to_message(only_thinking, out));
}

TEST(TranscriptTest, ToolResultArrayContentIsJoined) {
    ConversationMessage out;
    Json env = Json::parse(R"({"type":"user","message":{"role":"user","content":[
        {"type":"tool_result","tool_use_id":"t9","content":[
            {"type":"text","text":"line one\n"},
            {"type":"image","source":{}},
            {"type":"text","text":"line two"}]}]}})");
    ASSERT_TRUE(envelope_to_message(env, out));
    ASSERT_EQ(1u, out.content.size());
    EXPECT_EQ("t9", out.content[0].id);
    EXPECT_EQ("line one\nline two", out.content[0].text);
    EXPECT_FALSE(out.content[0].is_error);
}

TEST(TranscriptTest, UnsupportedRolesAreCounted) {
    std::vector<Json> envelopes;
    envelopes.push_back(Json::parse(R"({"type":"system","message":{"role":"system","content":"x"}})"));
    envelopes.push_back(Json::parse(R"({"role":"tool","content":"y"})"));
    envelopes.push_back(Json::parse(R"("not an object")"));
    envelopes.push_back(Json::parse(R"({"role":"user","content":"kept"})"));

    ParseResult parsed = parse_envelopes(envelopes);
    ASSERT_TRUE(parsed.success);
    EXPECT_EQ(3u, parsed.dropped);
    ASSERT_EQ(1u, parsed.messages.size());
    EXPECT_EQ("kept", parsed.messages[0].text());
}

TEST(TranscriptTest, WrongFieldTypeFailsTheWholeTranscript) {
    std::vector<Json> envelopes;
    envelopes.push_back(Json::parse(R"({"role":"user","content":[{"type":"text","text":42}]})"));

    ParseResult parsed = parse_envelopes(envelopes);
    EXPECT_FALSE(parsed.success);
    EXPECT_EQ(0u, parsed.error.find("invalid transcript: "));
}

TEST(TranscriptTest, EnvelopeArrayText) {
    ParseResult bad = parse_envelope_array("{not json");
    EXPECT_FALSE(bad.success);
    EXPECT_EQ("transcript is not valid JSON", bad.error);

    ParseResult object = parse_envelope_array(R"({"role":"user"})");
    EXPECT_FALSE(object.success);
    EXPECT_EQ("transcript must be a JSON array", object.error);

    ParseResult ok = parse_envelope_array(R"([{"role":"user","content":"a"},{"role":"assistant","content":"b"}])");
    ASSERT_TRUE(ok.success);
    EXPECT_EQ(2u, ok.messages.size());
}

// ============================================================================
// Turn reconstruction
// ============================================================================

TEST(TranscriptTest, ConvertsToolExchangeIntoOneTurn) {
    std::vector<ConversationTurn> turns = convert_messages_to_turns(tool_exchange());
    ASSERT_EQ(1u, turns.size());
    EXPECT_EQ("Run the tests", turns[0].user_message);
    EXPECT_EQ("Running them now.\nTwo tests fail.", turns[0].assistant_response);
    ASSERT_EQ(1u, turns[0].tool_calls.size());
    EXPECT_EQ("Bash", turns[0].tool_calls[0].tool);
    ASSERT_EQ(1u, turns[0].tool_results.size());
    EXPECT_FALSE(turns[0].tool_results[0].success);
    EXPECT_GT(turns[0].tokens, 0);
}

TEST(TranscriptTest, PreviousErrorCarriesToNextTurn) {
    std::vector<ConversationMessage> messages = tool_exchange();
    messages.push_back(ConversationMessage::user("Fix them"));
    messages.push_back(ConversationMessage::assistant("Fixed."));

    std::vector<ConversationTurn> turns = convert_messages_to_turns(messages);
    ASSERT_EQ(2u, turns.size());
    EXPECT_FALSE(turns[0].previous_error);
    EXPECT_TRUE(turns[1].previous_error);
    EXPECT_LT(turns[0].timestamp, turns[1].timestamp);
}

TEST(TranscriptTest, UnpairedToolBlocksAreDropped) {
    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::user("go"));

    ConversationMessage call;
    call.role = MessageRole::ASSISTANT;
    call.content.push_back(ContentBlock::make_tool_use(ToolCall("Read", "answered", Json::object())));
    call.content.push_back(ContentBlock::make_tool_use(ToolCall("Read", "dangling", Json::object())));
    messages.push_back(call);

    ConversationMessage results;
    results.role = MessageRole::USER;
    results.content.push_back(ContentBlock::make_tool_result(ToolResult("answered", true, "ok")));
    results.content.push_back(ContentBlock::make_tool_result(ToolResult("stray", true, "??")));
    messages.push_back(results);

    std::vector<ConversationTurn> turns = convert_messages_to_turns(messages);
    ASSERT_EQ(1u, turns.size());
    ASSERT_EQ(1u, turns[0].tool_calls.size());
    EXPECT_EQ("answered", turns[0].tool_calls[0].id);
    ASSERT_EQ(1u, turns[0].tool_results.size());
    EXPECT_EQ("answered", turns[0].tool_results[0].tool_use_id);
}

TEST(TranscriptTest, AssistantBeforeFirstUserIsIgnored) {
    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::assistant("Hello! How can I help?"));
    messages.push_back(ConversationMessage::user("Hi"));

    std::vector<ConversationTurn> turns = convert_messages_to_turns(messages);
    ASSERT_EQ(1u, turns.size());
    EXPECT_EQ("Hi", turns[0].user_message);
    EXPECT_TRUE(turns[0].assistant_response.empty());
}
