#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "anamnesis/cli/commands.hpp"
#include "anamnesis/cli/options.hpp"
#include "anamnesis/core/config.hpp"
#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/hashing.hpp"
#include "anamnesis/core/log.hpp"
#include "anamnesis/core/model_json.hpp"
#include "anamnesis/core/models.hpp"
#include "anamnesis/core/types.hpp"
#include "anamnesis/ingest/coordinator.hpp"
#include "anamnesis/net/framing.hpp"
#include "anamnesis/net/protocol.hpp"
#include "anamnesis/net/term.hpp"
#include "anamnesis/parser/decoders.hpp"
#include "anamnesis/parser/fences.hpp"
#include "anamnesis/parser/format.hpp"
#include "anamnesis/parser/timestamp.hpp"
#include "anamnesis/parser/validate.hpp"
#include "anamnesis/rdf/generator.hpp"
#include "anamnesis/rdf/ntriples.hpp"
#include "anamnesis/rdf/schema.hpp"
#include "anamnesis/reasoning/contamination.hpp"
#include "anamnesis/reasoning/engine.hpp"
#include "anamnesis/reasoning/lifecycle.hpp"
#include "anamnesis/reasoning/membership.hpp"
#include "anamnesis/reasoning/references.hpp"
#include "anamnesis/store/sqlite_store.hpp"
#include "anamnesis/store/triple_store.hpp"
#include "anamnesis/worker/cancel.hpp"
#include "anamnesis/worker/channel.hpp"
#include "anamnesis/worker/factory.hpp"
#include "anamnesis/worker/pool.hpp"
#include "anamnesis/worker/server.hpp"
#include "anamnesis/worker/transport.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
