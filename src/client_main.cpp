#include "headers.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace {

const char* kTag = "Interview Client";

// Everything the console loop reacts to, in arrival order.
struct ClientEvent {
    enum class Kind { Chunk, Silence, DeviceError, Session, Command };

    Kind kind = Kind::Command;
    AudioChunk chunk;
    SessionEvent event;
    std::string command;
};

void printHelp() {
    std::cout << "Commands:\n"
                 "  f           finalize: treat what was said so far as the question\n"
                 "  r [text]    regenerate the last answer, or answer the given question\n"
                 "  c           clear transcript, context and answers\n"
                 "  u           re-upload the profile\n"
                 "  p           pause or resume the microphone\n"
                 "  a           list answers\n"
                 "  q           quit\n";
}

void printAnswer(const AnswerRecord& a) {
    std::cout << "\n=== Answer to question " << a.questionId << (a.regenerated ? " (regenerated)" : "")
              << (a.source == "uploaded" ? " [prepared]" : "") << (a.grounded ? "" : " [generic]") << " ===\n"
              << "Q: " << a.question << "\n"
              << a.answer << "\n"
              << std::string(40, '=') << std::endl;
}

void printError(const SessionStateMachine::ErrorInfo& e) {
    switch (e.kind) {
        case ErrorKind::TransportDisconnected:
            std::cout << "!! Connection lost: " << e.message << std::endl;
            break;
        case ErrorKind::DeviceUnavailable:
            std::cout << "!! Microphone unavailable: " << e.message << std::endl;
            break;
        case ErrorKind::GenerationTimeout:
            std::cout << "!! Answer timed out (question " << e.questionId << "). Type 'r' to retry." << std::endl;
            break;
        case ErrorKind::GenerationFailure:
            std::cout << "!! Answer failed (question " << e.questionId << "): " << e.message
                      << ". Type 'r' to retry." << std::endl;
            break;
        default:
            std::cout << "!! " << errorCode(e.kind) << ": " << e.message << std::endl;
            break;
    }
}

} // namespace

int main(int argc, char** argv) {
    ClientConfig config;
    try {
        config = loadClientConfig(argsFrom(argc, argv));
        Log::setLevel(Log::parseLevel(config.logLevel));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n" << clientUsage();
        return 2;
    }
    if (config.help) {
        std::cout << clientUsage();
        return 0;
    }

    try {
        if (config.listDevices) {
            AudioCaptureEngine::listDevices();
            return 0;
        }

        std::unique_ptr<ProfileSource> profiles;
        if (config.profilePath.empty()) {
            Log::warn(kTag, "No --profile given; answers will not be grounded in your background");
            profiles = std::make_unique<StaticProfileSource>();
        } else {
            profiles = std::make_unique<JsonFileProfileSource>(config.profilePath);
        }

        // Shared with the detached stdin thread, which may outlive this scope.
        auto events = std::make_shared<EventChannel<ClientEvent>>();

        SessionTransport transport(config.transport, [&](const SessionEvent& e) {
            ClientEvent ev;
            ev.kind = ClientEvent::Kind::Session;
            ev.event = e;
            events->push(std::move(ev));
        });

        AudioCaptureEngine capture(
            config.capture,
            [&](AudioChunk chunk) {
                ClientEvent ev;
                ev.kind = ClientEvent::Kind::Chunk;
                ev.chunk = std::move(chunk);
                events->push(std::move(ev));
            },
            nullptr,
            [&] {
                ClientEvent ev;
                ev.kind = ClientEvent::Kind::Silence;
                events->push(std::move(ev));
            },
            [&](const SessionError& error) {
                ClientEvent ev;
                ev.kind = ClientEvent::Kind::DeviceError;
                ev.event = SessionEvent::error(error.kind(), error.what());
                events->push(std::move(ev));
            });

        ClientSession session(config.session, transport, *profiles);

        transport.connect();
        try {
            capture.start();
        } catch (const SessionError& e) {
            // Commands still work without a microphone.
            Log::error(kTag, e.what());
            session.onEvent(SessionEvent::error(e.kind(), e.what()));
            printError(*session.state().lastError());
        }

        // Blocks in getline, so it is detached rather than joined
        std::thread([events] {
            std::string line;
            while (std::getline(std::cin, line)) {
                ClientEvent ev;
                ev.kind = ClientEvent::Kind::Command;
                ev.command = line;
                if (!events->push(std::move(ev))) return;
            }
            ClientEvent quit;
            quit.command = "q";
            events->push(std::move(quit));
        }).detach();

        printHelp();

        std::string shownState = session.state().label();
        std::size_t shownAnswers = 0;
        bool quit = false;

        ClientEvent ev;
        while (!quit && events->pop(ev)) {
            switch (ev.kind) {
                case ClientEvent::Kind::Chunk:
                    session.onChunk(ev.chunk);
                    break;

                case ClientEvent::Kind::Silence:
                    session.onSilence();
                    break;

                case ClientEvent::Kind::DeviceError:
                case ClientEvent::Kind::Session: {
                    session.onEvent(ev.event);
                    const SessionEvent& e = ev.event;
                    if (e.type == SessionEvent::Type::Transcription && e.isFinal) {
                        std::cout << "[heard] " << e.text << std::endl;
                    } else if (e.type == SessionEvent::Type::QuestionDetected) {
                        std::cout << "\n>> Question " << e.question.id << " ("
                                  << questionKindName(e.question.kind) << "): " << e.question.text << std::endl;
                    } else if (e.type == SessionEvent::Type::Error && session.state().lastError()) {
                        printError(*session.state().lastError());
                    }
                    break;
                }

                case ClientEvent::Kind::Command: {
                    std::istringstream in(ev.command);
                    std::string cmd;
                    in >> cmd;
                    std::string rest;
                    std::getline(in, rest);
                    rest = trim(rest);

                    if (cmd == "q") {
                        quit = true;
                    } else if (cmd == "f") {
                        if (!session.finalize()) std::cout << "Not connected." << std::endl;
                    } else if (cmd == "r") {
                        session.regenerate(rest);
                    } else if (cmd == "c") {
                        if (!session.clear()) std::cout << "Not connected." << std::endl;
                    } else if (cmd == "u") {
                        if (!session.refreshContext()) std::cout << "Not connected." << std::endl;
                    } else if (cmd == "p") {
                        if (capture.isPaused()) {
                            capture.resume();
                            std::cout << "Microphone on." << std::endl;
                        } else {
                            capture.pause();
                            std::cout << "Microphone paused." << std::endl;
                        }
                    } else if (cmd == "a") {
                        for (const auto& a : session.state().answers()) printAnswer(a);
                    } else if (!cmd.empty()) {
                        printHelp();
                    }
                    break;
                }
            }

            const auto& answers = session.state().answers();
            if (answers.size() > shownAnswers) printAnswer(answers.front());
            shownAnswers = answers.size();

            const std::string label = session.state().label();
            if (label != shownState) {
                std::cout << "[" << label << "]" << std::endl;
                shownState = label;
            }
        }

        capture.stop();
        transport.close();
        events->close();

        Log::info(kTag, "Dropped " + std::to_string(transport.droppedChunks()) + " chunks while disconnected, held back " +
                            std::to_string(session.heldBackChunks()) + " before context");
    } catch (const std::exception& e) {
        Log::error(kTag, e.what());
        return 1;
    }
    return 0;
}
