#include "smppnet_error.h"
#include "smppnet_session.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
    if (argc < 5) {
        std::cerr << "Usage: " << argv[0] << " <host> <port> <system_id> <password> [destination] [text]" << std::endl;
        return 1;
    }

    std::string host = argv[1];
    int port = std::stoi(argv[2]);

    smppnet::BindParams bind;
    bind.systemId = argv[3];
    bind.password = argv[4];

    smppnet::SessionConfig config;
    config.verbose = true;

    smppnet::Session session(host, static_cast<uint16_t>(port), config);

    // Print every delivered message
    session.setPushHandler([](const smppnet::Message& message) {
        std::cout << "Received " << smppnet::commandName(message.command)
                  << " seq=" << message.sequence
                  << " body=" << smppnet::toHex(message.body) << std::endl;
    });

    try {
        session.connect();
        smppnet::Message bound = session.bindTransceiver(bind);
        std::cout << "Bound to '" << smppnet::responseId(bound) << "'" << std::endl;

        if (argc >= 6) {
            smppnet::SubmitParams submit;
            submit.destinationAddr = argv[5];
            submit.shortMessage = argc >= 7 ? argv[6] : "Hello from smppnet";
            smppnet::Message submitted = session.sendMessage(submit);
            std::cout << "Submitted, message_id='" << smppnet::responseId(submitted) << "'" << std::endl;
        }

        // Runs until the SMSC unbinds or closes the connection
        session.listen();
        session.disconnect();
    } catch (const smppnet::ProtocolError& e) {
        std::cerr << "SMSC error: " << e.what() << std::endl;
        session.disconnect();
        return 2;
    } catch (const smppnet::SessionError& e) {
        std::cerr << "Session error: " << e.what() << std::endl;
        session.disconnect();
        return 1;
    }
    return 0;
}
