#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "util/event_channel.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"

#include "audio/audio_chunk.hpp"
#include "audio/capture_engine.hpp"

#include "stt/recognizer.hpp"
#include "stt/whisper_recognizer.hpp"

#include "pipeline/answer_generator.hpp"
#include "pipeline/language_model.hpp"

#include "protocol/messages.hpp"
#include "server/session_server.hpp"

#include "client/client_session.hpp"
#include "client/profile_source.hpp"
#include "client/session_state_machine.hpp"
#include "client/session_transport.hpp"

#endif
