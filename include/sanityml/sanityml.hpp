#pragma once

/// sanityml - static risk scanner for ML projects
///
/// Main include file that provides access to all public APIs.

#include "sanityml/errors.hpp"
#include "sanityml/finding.hpp"
#include "sanityml/logging.hpp"
#include "sanityml/options.hpp"
#include "sanityml/types.hpp"

#include "sanityml/pickle/capability_graph.hpp"
#include "sanityml/pickle/opcode_reader.hpp"
#include "sanityml/pickle/opcodes.hpp"
#include "sanityml/pickle/value.hpp"

#include "sanityml/rules/rule_table.hpp"
#include "sanityml/analysis/risk_classifier.hpp"

#include "sanityml/source/notebook.hpp"
#include "sanityml/source/source_scanner.hpp"

#include "sanityml/container/demultiplexer.hpp"
#include "sanityml/container/zip_archive.hpp"
#include "sanityml/io/mapped_file.hpp"

#include "sanityml/deps/advisory.hpp"
#include "sanityml/deps/requirements.hpp"

#include "sanityml/discovery.hpp"
#include "sanityml/report.hpp"
#include "sanityml/scan_pool.hpp"
#include "sanityml/scanner.hpp"

namespace sanityml {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Get version string
inline const char* get_version() {
    return VERSION;
}

} // namespace sanityml
