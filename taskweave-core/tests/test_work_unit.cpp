/**
 * @file test_work_unit.cpp
 * @brief Tests for WorkUnit status transitions, delegation context and guard types
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/delegation_context.hpp"
#include "../src/errors.hpp"
#include "../src/work_unit.hpp"
#include <cmath>
#include <thread>

using namespace taskweave;

// ============================================================================
// WorkUnit Tests
// ============================================================================

TEST_CASE("WorkUnit: Created pending with a fresh id", "[work_unit]") {
    WorkUnit a = WorkUnit::create(WorkKind::USER_REQUEST, {{"text", "hello"}}, "conv-1");
    WorkUnit b = WorkUnit::create(WorkKind::USER_REQUEST, {{"text", "hello"}}, "conv-1");

    REQUIRE(a.status == WorkUnitStatus::PENDING);
    REQUIRE_FALSE(a.id.empty());
    REQUIRE(a.id != b.id);
    REQUIRE(a.conversation_id == "conv-1");
    REQUIRE_FALSE(a.parent_id.has_value());
}

TEST_CASE("WorkUnit: Children link to their parent", "[work_unit]") {
    WorkUnit parent = WorkUnit::create(WorkKind::USER_REQUEST, {{"text", "plan a trip"}}, "conv-2");
    WorkUnit child = parent.spawn_child(WorkKind::DELEGATED_TASK, {{"text", "book hotel"}});

    REQUIRE(child.parent_id == parent.id);
    REQUIRE(child.conversation_id == "conv-2");
    REQUIRE(child.kind == WorkKind::DELEGATED_TASK);
    REQUIRE(child.status == WorkUnitStatus::PENDING);
}

TEST_CASE("WorkUnit: Status transitions", "[work_unit]") {
    WorkUnit unit = WorkUnit::create(WorkKind::SCHEDULED_JOB, nlohmann::json::object());

    SECTION("Happy path") {
        unit.transition_to(WorkUnitStatus::RUNNING);
        unit.transition_to(WorkUnitStatus::AWAITING_APPROVAL);
        unit.transition_to(WorkUnitStatus::RUNNING);
        unit.complete({{"done", true}});

        REQUIRE(unit.status == WorkUnitStatus::COMPLETED);
        REQUIRE(unit.output.has_value());
        REQUIRE(unit.completed_at.has_value());
        REQUIRE(unit.is_terminal());
    }

    SECTION("Terminal statuses are final") {
        unit.fail(ErrorCode::HANDLER_FAILED, "boom");
        REQUIRE(unit.error->code == ErrorCode::HANDLER_FAILED);
        REQUIRE_THROWS_AS(unit.transition_to(WorkUnitStatus::RUNNING), InvalidTransitionError);
        REQUIRE_THROWS_AS(unit.complete(nlohmann::json::object()), InvalidTransitionError);
    }

    SECTION("Pending cannot skip to completed") {
        REQUIRE_THROWS_AS(unit.complete(nlohmann::json::object()), InvalidTransitionError);
    }

    SECTION("Cancel records the reason") {
        unit.cancel(ErrorCode::APPROVAL_REJECTED, "denied");
        REQUIRE(unit.status == WorkUnitStatus::CANCELLED);
        REQUIRE(unit.error->code == ErrorCode::APPROVAL_REJECTED);
    }
}

TEST_CASE("WorkUnit: Status and kind names", "[work_unit]") {
    REQUIRE(status_to_string(WorkUnitStatus::AWAITING_APPROVAL) == "awaiting_approval");
    REQUIRE(status_from_string("cancelled") == WorkUnitStatus::CANCELLED);
    REQUIRE_THROWS_AS(status_from_string("paused"), std::invalid_argument);

    REQUIRE(kind_to_string(WorkKind::BACKGROUND_TASK) == "background_task");
    REQUIRE(kind_from_string("scheduled_job") == WorkKind::SCHEDULED_JOB);
}

TEST_CASE("WorkUnit: JSON view carries error and partial outputs", "[work_unit]") {
    WorkUnit unit = WorkUnit::create(WorkKind::USER_REQUEST, {{"text", "x"}});
    unit.transition_to(WorkUnitStatus::RUNNING);
    unit.partial_outputs.push_back(PartialOutput{unit.id, "search", {{"hits", 2}}});
    unit.fail(ErrorCode::DEADLINE_EXCEEDED, "too slow");

    nlohmann::json j = unit.to_json();
    REQUIRE(j["status"] == "failed");
    REQUIRE(j["error"]["code"] == "DeadlineExceeded");
    REQUIRE(j["partial_outputs"].size() == 1);
    REQUIRE(j["partial_outputs"][0]["handler"] == "search");
}

TEST_CASE("WorkUnit: Input text is flattened for matching", "[work_unit]") {
    nlohmann::json input = {{"subject", "Refund"}, {"body", {"please", "help"}}, {"count", 3}};
    std::string text = flatten_text(input);

    REQUIRE(text.find("Refund") != std::string::npos);
    REQUIRE(text.find("please help") != std::string::npos);
    REQUIRE(text.find("3") == std::string::npos);
}

// ============================================================================
// DelegationContext Tests
// ============================================================================

TEST_CASE("BudgetLedger: Charges are shared and may go negative", "[budget]") {
    BudgetLedger ledger(10.0);

    REQUIRE(ledger.charge(4.0) == 6.0);
    REQUIRE_FALSE(ledger.exhausted());
    REQUIRE(ledger.charge(7.5) == -1.5);
    REQUIRE(ledger.exhausted());
    REQUIRE(ledger.spent() == 11.5);
}

TEST_CASE("DelegationContext: Descend tracks depth and path", "[delegation]") {
    DelegationContext root = DelegationContext::root(5.0, std::chrono::milliseconds(0), "corr-1");
    REQUIRE(root.depth == 0);
    REQUIRE(root.correlation_id == "corr-1");

    DelegationContext first = root.descend("planner");
    DelegationContext second = first.descend("booker");

    REQUIRE(second.depth == 2);
    REQUIRE(second.has_visited("planner"));
    REQUIRE(second.has_visited("booker"));
    REQUIRE_FALSE(root.has_visited("planner"));

    // Shared across the tree
    second.budget->charge(2.0);
    REQUIRE(root.budget_remaining() == 3.0);
}

TEST_CASE("DelegationContext: check_active reports the stop reason", "[delegation]") {
    SECTION("Active context passes") {
        DelegationContext ctx = DelegationContext::root(1.0, std::chrono::milliseconds(0));
        REQUIRE_NOTHROW(ctx.check_active());
        REQUIRE_FALSE(ctx.correlation_id.empty());
    }

    SECTION("Deadline") {
        DelegationContext ctx = DelegationContext::root(1.0, std::chrono::milliseconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(15));
        REQUIRE(ctx.deadline_passed());
        REQUIRE_THROWS_AS(ctx.check_active(), DeadlineExceededError);
    }

    SECTION("Cancellation") {
        DelegationContext ctx = DelegationContext::root(1.0, std::chrono::milliseconds(0));
        ctx.cancellation->cancel(ErrorCode::CANCELLED);
        REQUIRE_THROWS_AS(ctx.check_active(), CancelledError);
    }

    SECTION("Shutdown") {
        DelegationContext ctx = DelegationContext::root(1.0, std::chrono::milliseconds(0));
        ctx.cancellation->cancel(ErrorCode::SHUTDOWN_INTERRUPTED);
        REQUIRE_THROWS_AS(ctx.check_active(), ShutdownInterruptedError);
    }
}

TEST_CASE("CancellationToken: Parent cancellation reaches children", "[delegation]") {
    auto parent = std::make_shared<CancellationToken>();
    CancellationToken child(parent);

    REQUIRE_FALSE(child.is_cancelled());
    parent->cancel(ErrorCode::SHUTDOWN_INTERRUPTED);
    REQUIRE(child.is_cancelled());
    REQUIRE(child.reason() == ErrorCode::SHUTDOWN_INTERRUPTED);

    SECTION("First reason wins") {
        parent->cancel(ErrorCode::CANCELLED);
        REQUIRE(parent->reason() == ErrorCode::SHUTDOWN_INTERRUPTED);
    }
}
