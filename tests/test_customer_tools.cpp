#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include <string>

using namespace voicelive_bridge;

namespace {

struct ToolsFixture {
    std::shared_ptr<fakes::FakeDirectory> directory = std::make_shared<fakes::FakeDirectory>();
    std::shared_ptr<fakes::FakeNotifier> notifier = std::make_shared<fakes::FakeNotifier>();
    tools::ToolContext context;

    ToolsFixture() {
        directory->add(fakes::sample_client());
        context.directory = directory;
        context.notifier = notifier;
        context.sender_email = "support@example.com";
    }
};

tools::ToolErrorCode error_code_of(const std::function<void()>& call) {
    try {
        call();
    } catch (const tools::ToolError& ex) {
        return ex.code();
    }
    FAIL("expected a ToolError");
    return tools::ToolErrorCode::HandlerFailed;
}

}

TEST_CASE("lookup_client returns products and open cases only") {
    ToolsFixture fixture;
    const auto result = tools::lookup_client({{"client_id", "C123"}}, fixture.context);

    REQUIRE(result["client_id"] == "C123");
    REQUIRE(result["client_name"] == "Ada Lovelace");
    REQUIRE(result["products"].size() == 2);
    REQUIRE(result["products"][0]["name"] == "Premium Support");
    REQUIRE(result["open_cases"].size() == 1);
    REQUIRE(result["open_cases"][0]["id"] == "CASE-1");
}

TEST_CASE("lookup_client reports unknown clients and bad arguments") {
    ToolsFixture fixture;
    REQUIRE(error_code_of([&]() {
                tools::lookup_client({{"client_id", "C999"}}, fixture.context);
            }) == tools::ToolErrorCode::HandlerFailed);
    REQUIRE(error_code_of([&]() {
                tools::lookup_client({{"client_id", 42}}, fixture.context);
            }) == tools::ToolErrorCode::InvalidArguments);
    REQUIRE(error_code_of([&]() {
                tools::lookup_client(nlohmann::json::object(), tools::ToolContext{});
            }) == tools::ToolErrorCode::InvalidArguments);
}

TEST_CASE("create_support_case stores the case") {
    ToolsFixture fixture;
    const auto result = tools::create_support_case(
        {{"client_id", "C123"}, {"description", "Router keeps rebooting"}}, fixture.context);

    REQUIRE(result["case_id"] == "CASE-1001");
    REQUIRE(result["status"] == "open");
    REQUIRE(result["message"] ==
            "Support case #CASE-1001 created successfully for Ada Lovelace");
    const auto cases = fixture.directory->cases();
    REQUIRE(cases.size() == 1);
    REQUIRE(cases[0].second == "Router keeps rebooting");

    REQUIRE(error_code_of([&]() {
                tools::create_support_case({{"client_id", "C999"}, {"description", "x"}},
                                           fixture.context);
            }) == tools::ToolErrorCode::HandlerFailed);
}

TEST_CASE("send_conversation_summary emails an escaped summary") {
    ToolsFixture fixture;
    const auto result = tools::send_conversation_summary(
        {{"client_id", "C123"}, {"conversation_summary", "Reset <router>\nCall back"}},
        fixture.context);

    REQUIRE(result["operation_id"] == "op-1");
    REQUIRE(result["message"] == "Summary sent successfully to Ada Lovelace (ada@example.com)");
    const auto messages = fixture.notifier->messages();
    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0].recipient == "ada@example.com");
    REQUIRE(messages[0].sender == "support@example.com");
    REQUIRE(messages[0].html.find("Reset &lt;router&gt;<br>Call back") != std::string::npos);
    REQUIRE(messages[0].subject.find(result["case_id"].get<std::string>()) != std::string::npos);
}

TEST_CASE("Notifier failures surface from send_conversation_summary") {
    ToolsFixture fixture;
    fixture.notifier->set_fail(true);
    REQUIRE_THROWS_AS(tools::send_conversation_summary(
                          {{"client_id", "C123"}, {"conversation_summary", "done"}},
                          fixture.context),
                      backend::BackendError);
}

TEST_CASE("html_escape covers markup characters") {
    REQUIRE(tools::html_escape(R"(<a href="x">Tom & 'Jerry'</a>)") ==
            "&lt;a href=&quot;x&quot;&gt;Tom &amp; &#39;Jerry&#39;&lt;/a&gt;");
}

TEST_CASE("Customer registry exposes the three tools") {
    const auto registry = tools::make_customer_tool_registry();
    REQUIRE(registry->size() == 3);
    REQUIRE(registry->find(tools::kLookupClient) != nullptr);
    REQUIRE(registry->find(tools::kCreateSupportCase) != nullptr);
    REQUIRE(registry->find(tools::kSendConversationSummary) != nullptr);
    REQUIRE(registry->find("launch_rocket") == nullptr);

    const auto definition = registry->find(tools::kCreateSupportCase)->definition.to_json();
    REQUIRE(definition["type"] == "function");
    REQUIRE(definition["parameters"]["required"].size() == 2);

    tools::ToolRegistry duplicate;
    tools::register_customer_tools(duplicate);
    REQUIRE_THROWS_AS(tools::register_customer_tools(duplicate), std::invalid_argument);
}
