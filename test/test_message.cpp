#include "smppnet_body.h"
#include "smppnet_error.h"
#include "smppnet_frame.h"
#include "smppnet_message.h"
#include "smppnet_status.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace smppnet {
namespace {

std::vector<uint8_t> bytes(std::initializer_list<int> values) {
    std::vector<uint8_t> out;
    for (int v : values) out.push_back(static_cast<uint8_t>(v));
    return out;
}

template <typename F>
boost::system::error_code errorOf(F&& f) {
    try {
        f();
    } catch (const SessionError& e) {
        return e.code();
    }
    return {};
}

TEST(TestFrame, LengthPrefixIsBigEndian)
{
    uint8_t prefix[4];
    writeLengthPrefix(0x01020304u, prefix);
    EXPECT_EQ(prefix[0], 0x01);
    EXPECT_EQ(prefix[3], 0x04);
    EXPECT_EQ(readLengthPrefix(prefix), 0x01020304u);
}

TEST(TestFrame, EncodeAndSplitFrame)
{
    std::vector<uint8_t> body = bytes({0xAA, 0xBB, 0xCC});
    std::vector<uint8_t> frame = encodeFrame(body);
    EXPECT_EQ(frame, bytes({0, 0, 0, 7, 0xAA, 0xBB, 0xCC}));
    EXPECT_EQ(frameBody(frame), body);

    EXPECT_EQ(encodeFrame({}), bytes({0, 0, 0, 4}));
    EXPECT_TRUE(frameBody(bytes({0, 0, 0, 4})).empty());
}

TEST(TestFrame, MalformedFrames)
{
    EXPECT_EQ(errorOf([] { frameBody(bytes({0, 0})); }), error::Code::framing_error);
    EXPECT_EQ(errorOf([] { frameBody(bytes({0, 0, 0, 9, 1})); }), error::Code::framing_error);

    EXPECT_EQ(errorOf([] { checkFrameLength(3, 1024); }), error::Code::framing_error);
    EXPECT_EQ(errorOf([] { checkFrameLength(1025, 1024); }), error::Code::framing_error);
    EXPECT_FALSE(errorOf([] { checkFrameLength(4, 1024); }));
    EXPECT_FALSE(errorOf([] { checkFrameLength(1024, 1024); }));
}

TEST(TestMessage, EncodeHeader)
{
    Message message(Command::EnquireLink, 7);
    std::vector<uint8_t> frame = encode(message);

    EXPECT_EQ(frame, bytes({0, 0, 0, 16,  0, 0, 0, 0x15,  0, 0, 0, 0,  0, 0, 0, 7}));
    EXPECT_EQ(message.rawLength, 16u);
}

TEST(TestMessage, DecodeHeaderAndBody)
{
    std::vector<uint8_t> frame = bytes({0, 0, 0, 19,  0x80, 0, 0, 0x04,  0, 0, 0, 0x0B,  0, 0, 0x01, 0x02,
                                        'a', 'b', 0});
    Message message = decode(frame);

    EXPECT_EQ(message.command, Command::SubmitSmResp);
    EXPECT_EQ(message.status, status::ESME_RINVDSTADR);
    EXPECT_EQ(message.sequence, 0x0102u);
    EXPECT_EQ(message.rawLength, 19u);
    EXPECT_TRUE(message.isResponse());
    EXPECT_TRUE(message.isError());
    EXPECT_EQ(responseId(message), "ab");
}

TEST(TestMessage, EncodeThenDecodeKeepsFields)
{
    Message sent(Command::DataSm, kMaxSequence, bytes({1, 2, 3, 4, 5}));
    Message received = decode(encode(sent));

    EXPECT_EQ(received.command, sent.command);
    EXPECT_EQ(received.sequence, kMaxSequence);
    EXPECT_EQ(received.status, 0u);
    EXPECT_EQ(received.body, sent.body);
    EXPECT_EQ(received.rawLength, kHeaderSize + 5);
}

TEST(TestMessage, DecodeRejectsBadFrames)
{
    EXPECT_EQ(errorOf([] { decode(bytes({0, 0, 0, 8, 0, 0, 0, 0x15})); }), error::Code::decode_error);
    // Prefix claims 20 bytes, only 16 present.
    EXPECT_EQ(errorOf([] { decode(bytes({0, 0, 0, 20, 0, 0, 0, 0x15, 0, 0, 0, 0, 0, 0, 0, 1})); }),
              error::Code::decode_error);
    // command_id 0x0A is not assigned.
    EXPECT_EQ(errorOf([] { decode(bytes({0, 0, 0, 16, 0, 0, 0, 0x0A, 0, 0, 0, 0, 0, 0, 0, 1})); }),
              error::Code::decode_error);
}

TEST(TestMessage, MakeResponseEchoesSequence)
{
    Message request(Command::DeliverSm, 99, bytes({1, 2}));
    Message response = makeResponse(request, bytes({0}));

    EXPECT_EQ(response.command, Command::DeliverSmResp);
    EXPECT_EQ(response.sequence, 99u);
    EXPECT_EQ(response.status, 0u);
    EXPECT_EQ(response.body, bytes({0}));

    EXPECT_EQ(errorOf([] { makeResponse(Message(Command::Outbind, 1)); }), error::Code::usage_error);
    EXPECT_EQ(errorOf([] { makeResponse(Message(Command::UnbindResp, 1)); }), error::Code::usage_error);
}

TEST(TestMessage, SequenceWrapsToOne)
{
    EXPECT_EQ(nextSequenceAfter(1), 2u);
    EXPECT_EQ(nextSequenceAfter(kMaxSequence - 1), kMaxSequence);
    EXPECT_EQ(nextSequenceAfter(kMaxSequence), 1u);
    EXPECT_EQ(nextSequenceAfter(0xFFFFFFFFu), 1u);
}

TEST(TestMessage, Hex)
{
    EXPECT_EQ(toHex(bytes({0x00, 0x0f, 0xa0, 0xff})), "000fa0ff");
    EXPECT_EQ(toHex({}), "");
}

TEST(TestBody, BindBodyLayout)
{
    BindParams params;
    params.systemId = "esme";
    params.password = "pw";
    params.addrTon = 1;
    params.addrNpi = 2;

    EXPECT_EQ(encodeBindBody(params), bytes({'e', 's', 'm', 'e', 0,  'p', 'w', 0,  0,  0x34, 1, 2,  0}));
}

TEST(TestBody, BindFieldLimits)
{
    BindParams params;
    params.systemId = std::string(15, 'x');
    params.password = std::string(8, 'y');
    EXPECT_FALSE(errorOf([&] { encodeBindBody(params); }));

    params.systemId = std::string(16, 'x');
    EXPECT_EQ(errorOf([&] { encodeBindBody(params); }), error::Code::invalid_argument);

    params.systemId = "esme";
    params.password = std::string(9, 'y');
    EXPECT_EQ(errorOf([&] { encodeBindBody(params); }), error::Code::invalid_argument);
}

TEST(TestBody, SubmitBodyLayout)
{
    SubmitParams params;
    params.sourceAddr = "100";
    params.destinationAddr = "200";
    params.dataCoding = 3;
    params.shortMessage = "hi";

    std::vector<uint8_t> expected = bytes({
        0,                       // service_type
        0, 0, '1', '0', '0', 0,  // source
        0, 0, '2', '0', '0', 0,  // destination
        0, 0, 0,                 // esm_class, protocol_id, priority_flag
        0, 0,                    // schedule_delivery_time, validity_period
        0, 0, 3, 0,              // registered_delivery, replace_if_present, data_coding, sm_default_msg_id
        2, 'h', 'i',
    });
    EXPECT_EQ(encodeSubmitBody(params), expected);
}

TEST(TestBody, ShortMessageLimit)
{
    SubmitParams params;
    params.shortMessage = std::string(kMaxShortMessage, 'm');
    std::vector<uint8_t> body = encodeSubmitBody(params);
    EXPECT_EQ(body.size(), 17 + kMaxShortMessage);

    params.shortMessage.push_back('m');
    EXPECT_EQ(errorOf([&] { encodeSubmitBody(params); }), error::Code::invalid_argument);

    params.shortMessage = "ok";
    params.destinationAddr = std::string(21, '9');
    EXPECT_EQ(errorOf([&] { encodeSubmitBody(params); }), error::Code::invalid_argument);
}

TEST(TestBody, Reader)
{
    std::vector<uint8_t> body = bytes({'i', 'd', 0, 7, 0, 0, 1});
    BodyReader r(body);
    EXPECT_EQ(r.cstring(), "id");
    EXPECT_EQ(r.u8(), 7);
    EXPECT_FALSE(r.atEnd());
    EXPECT_EQ(errorOf([&] { r.u32(); }), error::Code::decode_error);

    std::vector<uint8_t> unterminated = bytes({'a', 'b'});
    BodyReader r2(unterminated);
    EXPECT_EQ(errorOf([&] { r2.cstring(); }), error::Code::decode_error);

    EXPECT_EQ(responseId(Message(Command::DeliverSmResp, 1)), "");
}

TEST(TestError, Category)
{
    boost::system::error_code ec = error::Code::framing_error;
    EXPECT_STREQ(ec.category().name(), "smppnet");
    EXPECT_EQ(ec.message(), "Malformed or truncated frame");
    EXPECT_EQ(ec, error::make_error_code(error::Code::framing_error));
    EXPECT_NE(ec, error::Code::end_of_stream);
}

TEST(TestError, ProtocolErrorText)
{
    ProtocolError e(Command::BindTransceiverResp, status::ESME_RBINDFAIL);
    EXPECT_EQ(e.code(), error::Code::protocol_error);
    EXPECT_EQ(e.command(), Command::BindTransceiverResp);
    EXPECT_EQ(e.status(), status::ESME_RBINDFAIL);
    EXPECT_NE(std::string(e.what()).find("(0x0000000d) bind_transceiver_resp: Bind Failed"), std::string::npos);
}

TEST(TestStatus, Descriptions)
{
    EXPECT_STREQ(statusDescription(status::ESME_ROK), "No Error");
    EXPECT_STREQ(statusDescription(status::ESME_RINVBNDSTS), "Incorrect BIND Status for given command");
    EXPECT_STREQ(statusDescription(0x12345678u), "Unknown status");
}

} // namespace
} // namespace smppnet
