#include <gtest/gtest.h>

#include "core/DetectionStateMachine.h"
#include "TestSupport.h"

using namespace CER;
using CER::Test::ManualClock;

namespace {

constexpr qint64 POST_MS = 15000;

DetectionEvent detection(const ManualClock& clock, bool present) {
    DetectionEvent event;
    event.deviceName = "front";
    event.observedAtMs = clock.monotonicMs();
    event.observedAt = clock.now();
    event.isPresent = present;
    return event;
}

} // namespace

class DetectionStateMachineTest : public ::testing::Test {
protected:
    ManualClock clock{0};
    DetectionStateMachine machine{"front", POST_MS, &clock};
};

TEST_F(DetectionStateMachineTest, StartsIdle) {
    EXPECT_EQ(machine.state(), DetectionState::Idle);
    EXPECT_EQ(machine.msUntilDeadline(), -1);
    EXPECT_FALSE(machine.checkDeadline().has_value());
}

TEST_F(DetectionStateMachineTest, AbsenceWhileIdleDoesNothing) {
    EXPECT_FALSE(machine.onEvent(detection(clock, false)).has_value());
    EXPECT_EQ(machine.state(), DetectionState::Idle);
}

TEST_F(DetectionStateMachineTest, PresenceStartsSession) {
    clock.set(1000);
    const auto command = machine.onEvent(detection(clock, true));

    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->type, SessionCommandType::Start);
    EXPECT_EQ(command->deviceName, "front");
    EXPECT_EQ(command->deadlineMs, 1000 + POST_MS);
    EXPECT_EQ(machine.state(), DetectionState::Active);
    EXPECT_EQ(machine.msUntilDeadline(), POST_MS);
}

TEST_F(DetectionStateMachineTest, PresenceWhileActiveExtends) {
    machine.onEvent(detection(clock, true));
    clock.advance(5000);

    const auto command = machine.onEvent(detection(clock, true));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->type, SessionCommandType::Extend);
    EXPECT_EQ(command->deadlineMs, 5000 + POST_MS);
}

TEST_F(DetectionStateMachineTest, AbsenceNeverShortensWindow) {
    machine.onEvent(detection(clock, true));
    clock.advance(1000);

    EXPECT_FALSE(machine.onEvent(detection(clock, false)).has_value());
    EXPECT_EQ(machine.deadlineMs(), POST_MS);
    EXPECT_TRUE(machine.isActive());
}

TEST_F(DetectionStateMachineTest, DeadlineNeverMovesBackwards) {
    machine.onEvent(detection(clock, true));
    clock.advance(8000);
    machine.onEvent(detection(clock, true));

    // Late-delivered notification observed before the latest one
    DetectionEvent stale = detection(clock, true);
    stale.observedAtMs = 2000;
    const auto command = machine.onEvent(stale);

    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->deadlineMs, 8000 + POST_MS);
    EXPECT_EQ(machine.deadlineMs(), 8000 + POST_MS);
}

TEST_F(DetectionStateMachineTest, StopsExactlyAtDeadline) {
    machine.onEvent(detection(clock, true));

    clock.set(POST_MS - 1);
    EXPECT_FALSE(machine.checkDeadline().has_value());

    clock.set(POST_MS);
    const auto command = machine.checkDeadline();
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->type, SessionCommandType::Stop);
    EXPECT_EQ(machine.state(), DetectionState::Idle);

    EXPECT_FALSE(machine.checkDeadline().has_value());
}

// present at t=0 and t=5, nothing until t=20, post = 15 s
TEST_F(DetectionStateMachineTest, BurstProducesOneSessionEndingAfterLastDetection) {
    QList<SessionCommandType> commands;
    auto record = [&commands](const std::optional<SessionCommand>& command) {
        if (command) {
            commands.append(command->type);
        }
    };

    record(machine.onEvent(detection(clock, true)));
    for (qint64 t = 1000; t <= 30000; t += 1000) {
        clock.set(t);
        record(machine.checkDeadline());
        if (t == 5000) {
            record(machine.onEvent(detection(clock, true)));
            EXPECT_EQ(machine.deadlineMs(), 20000);
        }
        if (t == 20000) {
            EXPECT_EQ(machine.state(), DetectionState::Idle);
            EXPECT_FALSE(machine.onEvent(detection(clock, false)).has_value());
        }
    }

    const QList<SessionCommandType> expected{SessionCommandType::Start,
                                             SessionCommandType::Extend,
                                             SessionCommandType::Stop};
    EXPECT_EQ(commands, expected);
    EXPECT_EQ(machine.activationCount(), 1);
}

TEST_F(DetectionStateMachineTest, ActivationCountMatchesIdleToActiveTransitions) {
    // Three episodes separated by more than the post-detection window
    const QList<qint64> detections{0, 2000, 4000, 40000, 41000, 90000};
    int starts = 0;
    int index = 0;

    for (qint64 t = 0; t <= 120000; t += 500) {
        clock.set(t);
        if (machine.checkDeadline()) {
            EXPECT_GE(t, machine.lastPositiveMs() + POST_MS);
            EXPECT_LT(t, machine.lastPositiveMs() + POST_MS + 500);
        }
        if (index < detections.size() && detections[index] == t) {
            const auto command = machine.onEvent(detection(clock, true));
            ASSERT_TRUE(command.has_value());
            if (command->type == SessionCommandType::Start) {
                starts++;
            }
            index++;
        }
    }

    EXPECT_EQ(starts, 3);
    EXPECT_EQ(machine.activationCount(), 3);
    EXPECT_EQ(machine.state(), DetectionState::Idle);
}

TEST_F(DetectionStateMachineTest, ResetReturnsToIdleWithoutCommand) {
    machine.onEvent(detection(clock, true));
    machine.reset();

    EXPECT_EQ(machine.state(), DetectionState::Idle);
    EXPECT_FALSE(machine.checkDeadline().has_value());

    const auto command = machine.onEvent(detection(clock, true));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->type, SessionCommandType::Start);
}

TEST_F(DetectionStateMachineTest, CommandsCarryLocalWallTime) {
    clock.set(3000);
    DetectionEvent event = detection(clock, true);
    // Camera clock reset to its factory default
    event.observedAt = QDateTime::fromString("2001-01-01T00:00:00Z", Qt::ISODate);

    const auto command = machine.onEvent(event);
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->at, clock.now());
}

// Change-only camera: present at t=0, absent at t=40, post = 15 s
TEST(DetectionStateMachineHoldTest, HeldPresenceRecordsUntilPersonLeaves) {
    ManualClock clock{0};
    DetectionStateMachine machine{"front", POST_MS, &clock, true};

    QList<SessionCommandType> commands;
    qint64 stoppedAt = -1;

    ASSERT_TRUE(machine.onEvent(detection(clock, true)).has_value());
    for (qint64 t = 1000; t <= 70000; t += 1000) {
        clock.set(t);
        if (auto command = machine.checkDeadline()) {
            commands.append(command->type);
            if (command->type == SessionCommandType::Stop) {
                stoppedAt = t;
            }
        }
        if (t == 40000) {
            EXPECT_TRUE(machine.isPresent());
            const auto command = machine.onEvent(detection(clock, false));
            ASSERT_TRUE(command.has_value());
            EXPECT_EQ(command->type, SessionCommandType::Extend);
            EXPECT_EQ(command->deadlineMs, 55000);
        }
    }

    EXPECT_EQ(stoppedAt, 55000);
    EXPECT_EQ(commands.count(SessionCommandType::Stop), 1);
    EXPECT_FALSE(commands.contains(SessionCommandType::Start));
    EXPECT_EQ(machine.activationCount(), 1);
    EXPECT_FALSE(machine.isActive());
}

TEST(DetectionStateMachineHoldTest, AbsenceStillNeverShortensWindow) {
    ManualClock clock{0};
    DetectionStateMachine machine{"front", POST_MS, &clock, true};

    machine.onEvent(detection(clock, true));
    clock.set(30000);
    machine.checkDeadline();
    EXPECT_EQ(machine.deadlineMs(), 30000 + POST_MS);

    // Absence reported late, stamped before the last refresh
    DetectionEvent late = detection(clock, false);
    late.observedAtMs = 10000;
    machine.onEvent(late);
    EXPECT_EQ(machine.deadlineMs(), 30000 + POST_MS);
    EXPECT_FALSE(machine.isPresent());

    // A second absence is a no-op
    EXPECT_FALSE(machine.onEvent(detection(clock, false)).has_value());
}

TEST(DetectionStateMachineHoldTest, ResetForgetsPresence) {
    ManualClock clock{0};
    DetectionStateMachine machine{"front", POST_MS, &clock, true};

    machine.onEvent(detection(clock, true));
    machine.reset();
    EXPECT_FALSE(machine.isPresent());

    clock.set(60000);
    EXPECT_FALSE(machine.checkDeadline().has_value());
    EXPECT_FALSE(machine.isActive());
}
