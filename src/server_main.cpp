#include "headers.hpp"

#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = loadServerConfig(argsFrom(argc, argv));
        Log::setLevel(Log::parseLevel(config.logLevel));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n" << serverUsage();
        return 2;
    }
    if (config.help) {
        std::cout << serverUsage();
        return 0;
    }

    try {
        // STT model init, shared by every session
        auto model = std::make_shared<WhisperModel>(config.modelPath, config.useGpu);

        const WhisperRecognizer::Config whisper = config.whisper;
        RecognizerFactory recognizers = [model, whisper]() -> std::unique_ptr<Recognizer> {
            return std::make_unique<WhisperRecognizer>(model, whisper);
        };

        auto generator = std::make_shared<const AnswerGenerator>(std::make_shared<TemplateLanguageModel>(),
                                                                 config.answers);

        SessionServer server(config.server, recognizers, generator);
        server.start();

        std::string text;
        std::cout << "\nSession server running on port " << server.port() << "... Press enter to quit." << std::endl;
        std::getline(std::cin, text);

        server.stop();
    } catch (const std::exception& e) {
        Log::error("Session Server", e.what());
        return 1;
    }
    return 0;
}
