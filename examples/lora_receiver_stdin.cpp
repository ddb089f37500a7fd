// LoRa receiver that reads complex float32 samples from stdin and prints
// every decoded packet as one line on stdout

#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <lorabridge/loraconfig.hpp>
#include <lorabridge/loradecoderwriter.hpp>
#include <lorabridge/orchestrator.hpp>
#include <lorabridge/stdinsource.hpp>


volatile std::sig_atomic_t terminate = 0;

void sigint_handler(int sig)
{
    terminate = 1;
}


using namespace Lorabridge;

int main(int argc, char *argv[])
{
    Options options;
    try {
        options = parseArguments(argc, argv);
    } catch (const UsageException& e) {
        std::cerr << e.what() << std::endl << usage(argv[0]);
        return 1;
    }
    if (options.help) {
        std::cerr << usage(argv[0]);
        return 0;
    }

    // the decoded packets go out one per line, with no delay
    setvbuf(stdout, nullptr, _IOLBF, 0);

    try {
        Orchestrator receiver(options, makeLoraDecoderWriter);

        // handle Ctrl-C and kill
        signal(SIGINT, sigint_handler);
        signal(SIGTERM, sigint_handler);
        // a closed stdout must not kill us before the shutdown banner
        signal(SIGPIPE, SIG_IGN);

        receiver.run();
        receiver.waitForTermination(terminate);
        receiver.stop();
    } catch (const ConfigurationException& e) {
        std::cerr << "ERROR: invalid configuration: " << e.what() << std::endl;
        return 1;
    } catch (const IOException& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    fflush(stdout);

    return 0;
}
