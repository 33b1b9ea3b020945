#pragma once
// Static validator: rule-based checks over one source's descriptors
//
// Checks, per descriptor, in order:
//   missing command        error    (skips the command/argument checks)
//   command resolution     error    (skipped for ${...} templated commands)
//   argument paths         warning  (absolute, non-templated, missing)
//   missing type hint      info
//   empty env values       warning  (one per key)
//
// Never spawns a process and never touches the network.

#include <vaidya/descriptor.hpp>
#include <vaidya/types.hpp>
#include <string>
#include <vector>

namespace vaidya {

ValidationResult validate(const std::string& source_path,
                          const std::vector<ServiceDescriptor>& services);

// Extraction followed by validation. Document-level issues from extraction
// are carried into the result.
ValidationResult validate_document(const SourceDocument& document);

// Absolute or slash-containing commands are checked on the filesystem,
// bare names against PATH.
bool command_exists(const std::string& command);

} // namespace vaidya
