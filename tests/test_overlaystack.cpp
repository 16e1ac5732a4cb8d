/**
 * @file test_overlaystack.cpp
 * @brief Unit tests for OverlayStack and the concrete dialogs
 *
 * Tests cover:
 * - Pending command dispatched only after the closing transition
 * - Replacing an overlay without running its cancel callback
 * - Validation errors keeping an overlay open
 * - Key handling of confirm, wizard and search dialogs
 *
 * @see OverlayStack
 */

#include <gtest/gtest.h>
#include "dialogs.hpp"
#include "overlaystack.hpp"
#include "testsupport.hpp"

using ftxui::Event;

namespace {

/** @brief Overlay id carried by a transition effect */
uint64_t tickId(const Effect& effect) {
    TestEffectContext context;
    Message message = runEffect(effect, context);
    return std::get<OverlayTick>(message).overlayId;
}

void typeText(OverlayStack& stack, const std::string& text) {
    for (char c : text) {
        stack.handleKey(Event::Character(c));
    }
}

WizardSpec twoStepSpec() {
    FieldSpec name;
    name.key = "name";
    name.label = "Name";
    name.required = true;

    FieldSpec kind;
    kind.key = "kind";
    kind.label = "Kind";
    kind.kind = FieldKind::Choice;
    kind.options = {"Directory", "PostGIS"};
    kind.value = "Directory";

    FieldSpec host;
    host.key = "host";
    host.label = "Host";
    host.required = true;
    host.showIf = {"kind", {"PostGIS"}};

    WizardSpec spec;
    spec.title = "Create data store";
    spec.steps.push_back({"Name", {name}});
    spec.steps.push_back({"Connection", {kind, host}});
    return spec;
}

} // namespace

/**
 * @class OverlayStackTest
 * @brief Fixture counting callback invocations
 */
class OverlayStackTest : public ::testing::Test {
protected:
    OverlayStack stack;
    int confirmed = 0;
    int cancelled = 0;

    std::unique_ptr<ConfirmDialog> dialog(uint64_t request) {
        auto d = std::make_unique<ConfirmDialog>("Delete", "Delete layer 'roads'?");
        d->setOnConfirm([this, request](const FormValues&) {
            ++confirmed;
            return ConfirmOutcome::accept(immediate(CrudConfirmed{request, {}}));
        });
        d->setOnCancel([this, request]() -> std::optional<Effect> {
            ++cancelled;
            return immediate(CrudCancelled{request});
        });
        return d;
    }

    /** @brief Plays the closing transition, returns what the stack released */
    std::vector<Effect> finishClosing(std::vector<Effect> effects) {
        for (int frame = 0; frame < 10; ++frame) {
            if (effects.size() != 1 || effects[0].kind != EffectKind::Animation) {
                return effects;
            }
            effects = stack.onTick(OverlayTick{tickId(effects[0])});
        }
        return effects;
    }
};

/**
 * @test ConfirmDispatchesAfterTransition
 * @brief The command is released after exactly kCloseFrames ticks
 */
TEST_F(OverlayStackTest, ConfirmDispatchesAfterTransition) {
    EXPECT_TRUE(stack.open(dialog(7)).empty());
    const uint64_t id = stack.active()->id();

    auto effects = stack.handleKey(Event::Character('y'));
    ASSERT_EQ(effects.size(), 1u);
    EXPECT_EQ(effects[0].kind, EffectKind::Animation);
    EXPECT_EQ(confirmed, 1);
    EXPECT_TRUE(stack.hasPending());
    EXPECT_TRUE(stack.active()->isClosing());

    for (int frame = 1; frame < Overlay::kCloseFrames; ++frame) {
        effects = stack.onTick(OverlayTick{id});
        ASSERT_EQ(effects.size(), 1u);
        EXPECT_EQ(effects[0].kind, EffectKind::Animation);
        EXPECT_FALSE(stack.empty());
    }

    effects = stack.onTick(OverlayTick{id});
    EXPECT_TRUE(stack.empty());
    EXPECT_FALSE(stack.hasPending());
    ASSERT_EQ(effects.size(), 1u);
    TestEffectContext context;
    Message released = runEffect(effects[0], context);
    ASSERT_TRUE(std::holds_alternative<CrudConfirmed>(released));
    EXPECT_EQ(std::get<CrudConfirmed>(released).requestId, 7u);
}

/**
 * @test CancelRunsCancelCallback
 */
TEST_F(OverlayStackTest, CancelRunsCancelCallback) {
    stack.open(dialog(3));

    auto released = finishClosing(stack.handleKey(Event::Escape));

    EXPECT_EQ(cancelled, 1);
    EXPECT_EQ(confirmed, 0);
    ASSERT_EQ(released.size(), 1u);
    TestEffectContext context;
    EXPECT_TRUE(std::holds_alternative<CrudCancelled>(runEffect(released[0], context)));
}

/**
 * @test KeysWhileClosingAreDropped
 */
TEST_F(OverlayStackTest, KeysWhileClosingAreDropped) {
    stack.open(dialog(1));
    stack.handleKey(Event::Character('y'));

    EXPECT_TRUE(stack.handleKey(Event::Character('y')).empty());
    EXPECT_TRUE(stack.handleKey(Event::Escape).empty());
    EXPECT_EQ(confirmed, 1);
    EXPECT_EQ(cancelled, 0);
}

/**
 * @test ReplaceDoesNotCancel
 * @brief Opening over an open overlay drops it silently
 */
TEST_F(OverlayStackTest, ReplaceDoesNotCancel) {
    stack.open(dialog(1));

    auto effects = stack.open(std::make_unique<InfoOverlay>("Help", std::vector<std::string>{"q quit"}));

    EXPECT_TRUE(effects.empty());
    EXPECT_EQ(cancelled, 0);
    EXPECT_EQ(stack.active()->kind(), OverlayKind::Info);
}

/**
 * @test ReplaceWhileClosingReleasesPending
 * @brief The pending command of a closing overlay is not lost
 */
TEST_F(OverlayStackTest, ReplaceWhileClosingReleasesPending) {
    stack.open(dialog(5));
    auto tick = stack.handleKey(Event::Character('y'));
    const uint64_t old_id = tickId(tick[0]);

    auto effects = stack.open(std::make_unique<InfoOverlay>("Help", std::vector<std::string>{}));

    ASSERT_EQ(effects.size(), 1u);
    TestEffectContext context;
    EXPECT_TRUE(std::holds_alternative<CrudConfirmed>(runEffect(effects[0], context)));
    EXPECT_FALSE(stack.hasPending());
    EXPECT_EQ(cancelled, 0);

    // late frames of the replaced overlay change nothing
    EXPECT_TRUE(stack.onTick(OverlayTick{old_id}).empty());
    EXPECT_EQ(stack.active()->kind(), OverlayKind::Info);
}

/**
 * @test RejectedConfirmStaysOpen
 * @brief A validation error is shown in the overlay, nothing is dispatched
 */
TEST_F(OverlayStackTest, RejectedConfirmStaysOpen) {
    auto input = std::make_unique<InputDialog>("Go to", "Directory:");
    input->setOnConfirm([](const FormValues& values) {
        if (valueOf(values, "value").empty()) {
            return ConfirmOutcome::reject("Directory is required");
        }
        return ConfirmOutcome::accept(immediate(DirectoryChosen{valueOf(values, "value")}));
    });
    stack.open(std::move(input));

    EXPECT_TRUE(stack.handleKey(Event::Return).empty());
    EXPECT_EQ(stack.active()->error(), "Directory is required");
    EXPECT_FALSE(stack.active()->isClosing());

    typeText(stack, "/tmp");
    auto released = finishClosing(stack.handleKey(Event::Return));
    ASSERT_EQ(released.size(), 1u);
    TestEffectContext context;
    Message message = runEffect(released[0], context);
    ASSERT_TRUE(std::holds_alternative<DirectoryChosen>(message));
    EXPECT_EQ(std::get<DirectoryChosen>(message).path, "/tmp");
}

/**
 * @test ConfirmWithoutCommand
 */
TEST_F(OverlayStackTest, ConfirmWithoutCommand) {
    stack.open(std::make_unique<InfoOverlay>("Help", std::vector<std::string>{"line"}));

    auto released = finishClosing(stack.handleKey(Event::Escape));

    EXPECT_TRUE(released.empty());
    EXPECT_TRUE(stack.empty());
}

/**
 * @test ConfirmDialogKeys
 */
TEST(DialogTest, ConfirmDialogKeys) {
    ConfirmDialog dialog("Delete", "Sure?");
    EXPECT_EQ(dialog.handleKey(Event::Character('Y')), Overlay::KeyResult::Confirm);
    EXPECT_EQ(dialog.handleKey(Event::Return), Overlay::KeyResult::Confirm);
    EXPECT_EQ(dialog.handleKey(Event::Character('n')), Overlay::KeyResult::Cancel);
    EXPECT_EQ(dialog.handleKey(Event::Escape), Overlay::KeyResult::Cancel);
    EXPECT_EQ(dialog.handleKey(Event::Character('x')), Overlay::KeyResult::Consumed);
}

/**
 * @test WizardRequiresFieldsPerStep
 * @brief Enter validates the visible required fields of the current step
 */
TEST(DialogTest, WizardRequiresFieldsPerStep) {
    WizardOverlay wizard(twoStepSpec());

    EXPECT_EQ(wizard.handleKey(Event::Return), Overlay::KeyResult::Consumed);
    EXPECT_EQ(wizard.error(), "Name is required");
    EXPECT_EQ(wizard.step(), 0u);

    for (char c : std::string("roads")) {
        wizard.handleKey(Event::Character(c));
    }
    EXPECT_EQ(wizard.handleKey(Event::Return), Overlay::KeyResult::Consumed);
    EXPECT_EQ(wizard.step(), 1u);
    EXPECT_TRUE(wizard.error().empty());

    // host is hidden for a directory store
    EXPECT_EQ(wizard.handleKey(Event::Return), Overlay::KeyResult::Confirm);

    wizard.handleKey(Event::ArrowRight);
    EXPECT_EQ(wizard.value("kind"), "PostGIS");
    EXPECT_EQ(wizard.handleKey(Event::Return), Overlay::KeyResult::Consumed);
    EXPECT_EQ(wizard.error(), "Host is required");

    EXPECT_TRUE(wizard.setValue("host", "db.local"));
    EXPECT_EQ(wizard.handleKey(Event::Return), Overlay::KeyResult::Confirm);

    FormValues values = wizard.values();
    EXPECT_EQ(values["name"], "roads");
    EXPECT_EQ(values["kind"], "PostGIS");
    EXPECT_EQ(values["host"], "db.local");
}

/**
 * @test WizardEscapeGoesBack
 */
TEST(DialogTest, WizardEscapeGoesBack) {
    WizardOverlay wizard(twoStepSpec());
    wizard.setValue("name", "roads");
    wizard.handleKey(Event::Return);
    ASSERT_EQ(wizard.step(), 1u);

    EXPECT_EQ(wizard.handleKey(Event::Escape), Overlay::KeyResult::Consumed);
    EXPECT_EQ(wizard.step(), 0u);
    EXPECT_EQ(wizard.handleKey(Event::Escape), Overlay::KeyResult::Cancel);
    EXPECT_FALSE(wizard.setValue("missing", "x"));
}

/**
 * @test SearchFiltersCandidates
 */
TEST(DialogTest, SearchFiltersCandidates) {
    SearchOverlay search({{11, "roads", "local/topp/Layers/roads", "layer"},
                          {12, "rivers", "local/topp/Layers/rivers", "layer"},
                          {13, "sf", "local/sf", "workspace"}});
    EXPECT_EQ(search.matches().size(), 3u);

    for (char c : std::string("RIV")) {
        search.handleKey(Event::Character(c));
    }
    ASSERT_EQ(search.matches().size(), 1u);
    EXPECT_EQ(search.handleKey(Event::Return), Overlay::KeyResult::Confirm);
    EXPECT_EQ(search.values().at("node_id"), "12");

    search.handleKey(Event::Character('x'));
    EXPECT_EQ(search.handleKey(Event::Return), Overlay::KeyResult::Consumed);
    EXPECT_EQ(search.error(), "No match for 'RIVx'");
    EXPECT_TRUE(search.values().empty());
}

/**
 * @test SearchIgnoresAncestorNames
 * @brief A workspace name finds the workspace, not everything below it
 */
TEST(DialogTest, SearchIgnoresAncestorNames) {
    SearchOverlay search({{1, "topp", "local/topp", "workspace"},
                          {2, "Layers", "local/topp/Layers", "category"},
                          {3, "roads", "local/topp/Layers/roads", "layer"},
                          {4, "local", "local", "server"}});

    for (char c : std::string("topp")) {
        search.handleKey(Event::Character(c));
    }
    ASSERT_EQ(search.matches().size(), 1u);
    EXPECT_EQ(search.values().at("node_id"), "1");

    for (int i = 0; i < 4; ++i) {
        search.handleKey(Event::Backspace);
    }
    for (char c : std::string("LOCAL")) {
        search.handleKey(Event::Character(c));
    }
    ASSERT_EQ(search.matches().size(), 1u);
    EXPECT_EQ(search.matches()[0]->nodeId, 4u);
}

/**
 * @test ProgressClosesOnlyWhenDone
 */
TEST(DialogTest, ProgressClosesOnlyWhenDone) {
    ProgressOverlay progress("Upload", 4, 2);
    progress.update(UploadProgress{4, 1, 2, "b.zip", false});
    progress.update(UploadProgress{9, 0, 5, "other.zip", false});
    EXPECT_EQ(progress.index(), 1u);
    EXPECT_EQ(progress.handleKey(Event::Return), Overlay::KeyResult::Consumed);

    progress.finish(true, {"✓ a.zip", "✓ b.zip"});
    EXPECT_EQ(progress.handleKey(Event::Return), Overlay::KeyResult::Confirm);
}
