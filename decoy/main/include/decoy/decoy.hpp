// decoy Umbrella Header
//
// Include this single header to pull in the public mock server API:
//   - Server facade and listeners (MockServer, InProcessListener, Listener)
//   - Registration types (ExpectationSet, Expectation, Requirement, Responder, WebSocketExpectation, Reaction)
//   - Matchers and codecs (ValueMatcher, EntriesMatcher, Matcher, MessageMatcher, CallCount, codec registries)
//   - Diagnostics (MismatchReport, VerificationReport)
//
// Each re-exported header line is annotated with
//   IWYU pragma: export
// so that symbols they provide are treated as satisfied for direct use in user code.
#pragma once

#include "decoy/call-count.hpp"             // IWYU pragma: export
#include "decoy/codec-registry.hpp"         // IWYU pragma: export
#include "decoy/expectation-set.hpp"        // IWYU pragma: export
#include "decoy/expectation.hpp"            // IWYU pragma: export
#include "decoy/in-process-listener.hpp"    // IWYU pragma: export
#include "decoy/listener.hpp"               // IWYU pragma: export
#include "decoy/matcher.hpp"                // IWYU pragma: export
#include "decoy/message-matcher.hpp"        // IWYU pragma: export
#include "decoy/mismatch-report.hpp"        // IWYU pragma: export
#include "decoy/mock-server-config.hpp"     // IWYU pragma: export
#include "decoy/mock-server.hpp"            // IWYU pragma: export
#include "decoy/multipart.hpp"              // IWYU pragma: export
#include "decoy/reaction.hpp"               // IWYU pragma: export
#include "decoy/request-view.hpp"           // IWYU pragma: export
#include "decoy/responder.hpp"              // IWYU pragma: export
#include "decoy/response-description.hpp"   // IWYU pragma: export
#include "decoy/value-matcher.hpp"          // IWYU pragma: export
#include "decoy/verification-tracker.hpp"   // IWYU pragma: export
#include "decoy/websocket-expectation.hpp"  // IWYU pragma: export
