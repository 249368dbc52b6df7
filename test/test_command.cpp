#include "smppnet_command.h"

#include <gtest/gtest.h>

#include <map>
#include <set>

namespace smppnet {
namespace {

using States = std::set<SessionState>;

const States kBound = {SessionState::BoundTransmitter, SessionState::BoundReceiver, SessionState::BoundTransceiver};
const States kTransmit = {SessionState::BoundTransmitter, SessionState::BoundTransceiver};
const States kReceive = {SessionState::BoundReceiver, SessionState::BoundTransceiver};
const States kOpenOnly = {SessionState::Open};

const std::map<Command, States>& expectedMatrix() {
    static const std::map<Command, States> matrix = {
        {Command::BindTransmitter, kOpenOnly},     {Command::BindTransmitterResp, kOpenOnly},
        {Command::BindReceiver, kOpenOnly},        {Command::BindReceiverResp, kOpenOnly},
        {Command::BindTransceiver, kOpenOnly},     {Command::BindTransceiverResp, kOpenOnly},
        {Command::Outbind, kOpenOnly},
        {Command::Unbind, kBound},                 {Command::UnbindResp, kBound},
        {Command::SubmitSm, kTransmit},            {Command::SubmitSmResp, kTransmit},
        {Command::SubmitMulti, kTransmit},         {Command::SubmitMultiResp, kTransmit},
        {Command::DataSm, kBound},                 {Command::DataSmResp, kBound},
        {Command::DeliverSm, kReceive},            {Command::DeliverSmResp, kReceive},
        {Command::QuerySm, kReceive},              {Command::QuerySmResp, kReceive},
        {Command::CancelSm, kReceive},             {Command::CancelSmResp, kReceive},
        {Command::ReplaceSm, {SessionState::BoundTransmitter}},
        {Command::ReplaceSmResp, {SessionState::BoundTransmitter}},
        {Command::EnquireLink, kBound},            {Command::EnquireLinkResp, kBound},
        {Command::GenericNack, kBound},
    };
    return matrix;
}

const std::vector<SessionState> kAllStates = {
    SessionState::Closed, SessionState::Open, SessionState::BoundTransmitter,
    SessionState::BoundReceiver, SessionState::BoundTransceiver,
};

TEST(TestCommand, EveryCommandHasAMatrixEntry)
{
    EXPECT_EQ(allCommands().size(), expectedMatrix().size());
    for (Command command : allCommands()) {
        EXPECT_EQ(expectedMatrix().count(command), 1u) << commandName(command);
    }
}

TEST(TestCommand, PermittedStatesMatchTheMatrix)
{
    for (const auto& entry : expectedMatrix()) {
        for (SessionState state : kAllStates) {
            EXPECT_EQ(isCommandPermitted(entry.first, state), entry.second.count(state) == 1)
                << commandName(entry.first) << " in " << stateName(state);
        }
    }
}

TEST(TestCommand, NothingIsPermittedWhileClosed)
{
    for (Command command : allCommands()) {
        EXPECT_FALSE(isCommandPermitted(command, SessionState::Closed)) << commandName(command);
    }
}

TEST(TestCommand, StateSetters)
{
    EXPECT_EQ(stateAfter(Command::BindTransmitterResp), SessionState::BoundTransmitter);
    EXPECT_EQ(stateAfter(Command::BindReceiverResp), SessionState::BoundReceiver);
    EXPECT_EQ(stateAfter(Command::BindTransceiverResp), SessionState::BoundTransceiver);
    EXPECT_EQ(stateAfter(Command::UnbindResp), SessionState::Open);

    std::size_t setters = 0;
    for (Command command : allCommands()) {
        if (stateAfter(command)) ++setters;
    }
    EXPECT_EQ(setters, 4u);
    EXPECT_FALSE(stateAfter(Command::BindTransmitter));
    EXPECT_FALSE(stateAfter(Command::Unbind));
    EXPECT_FALSE(stateAfter(Command::GenericNack));
}

TEST(TestCommand, DirectionFollowsBit31)
{
    EXPECT_EQ(directionOf(Command::SubmitSm), Direction::Request);
    EXPECT_EQ(directionOf(Command::SubmitSmResp), Direction::Response);
    EXPECT_EQ(directionOf(Command::GenericNack), Direction::Response);
    EXPECT_EQ(directionOf(Command::Outbind), Direction::Request);
    EXPECT_EQ(directionOf(Command::DataSm), Direction::Request);
}

TEST(TestCommand, ResponseFor)
{
    EXPECT_EQ(responseFor(Command::BindTransceiver), Command::BindTransceiverResp);
    EXPECT_EQ(responseFor(Command::EnquireLink), Command::EnquireLinkResp);
    EXPECT_EQ(responseFor(Command::DataSm), Command::DataSmResp);
    EXPECT_EQ(responseFor(Command::SubmitMulti), Command::SubmitMultiResp);
    EXPECT_FALSE(responseFor(Command::Outbind));
    EXPECT_FALSE(responseFor(Command::SubmitSmResp));
    EXPECT_FALSE(responseFor(Command::GenericNack));
}

TEST(TestCommand, IdsAndNames)
{
    EXPECT_EQ(commandId(Command::BindReceiver), 0x00000001u);
    EXPECT_EQ(commandId(Command::EnquireLinkResp), 0x80000015u);
    EXPECT_EQ(commandId(Command::DataSm), 0x00000103u);
    EXPECT_EQ(commandFromId(0x80000004u), Command::SubmitSmResp);
    EXPECT_FALSE(commandFromId(0x0000000Au));
    EXPECT_FALSE(commandFromId(0x12345678u));

    EXPECT_STREQ(commandName(Command::SubmitSm), "submit_sm");
    EXPECT_STREQ(commandName(Command::GenericNack), "generic_nack");
    EXPECT_STREQ(stateName(SessionState::BoundTransceiver), "bound_trx");
    EXPECT_STREQ(stateName(SessionState::Closed), "closed");
}

TEST(TestCommand, BindCommands)
{
    EXPECT_EQ(bindCommand(BindMode::Transmitter), Command::BindTransmitter);
    EXPECT_EQ(bindCommand(BindMode::Receiver), Command::BindReceiver);
    EXPECT_EQ(bindCommand(BindMode::Transceiver), Command::BindTransceiver);

    EXPECT_TRUE(isReceiverBind(Command::BindReceiver));
    EXPECT_TRUE(isReceiverBind(Command::BindTransceiverResp));
    EXPECT_FALSE(isReceiverBind(Command::BindTransmitter));
    EXPECT_FALSE(isReceiverBind(Command::BindTransmitterResp));
}

} // namespace
} // namespace smppnet
