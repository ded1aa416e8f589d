#ifndef SDIMPORT_IMPORT_WORKFLOW_H
#define SDIMPORT_IMPORT_WORKFLOW_H

#include "copy_queue.h"
#include "copy_executor.h"
#include "command_runner.h"
#include "operator_prompt.h"
#include "photo_record.h"
#include "reorganizer.h"
#include "checksum_validator.h"
#include "path_builder.h"
#include "import_error.h"
#include "print_stream.h"

#include "sdimport.h"

#include <string>
#include <vector>
#include <memory>
#include <filesystem>

namespace sdimport {

enum class workflow_state_t {
   validating_paths,
   queuing,
   copying,
   reorganizing,
   validating_checksums,
   done,
   failed
};

const char *workflow_state_name(workflow_state_t state);

struct workflow_result_t {
   workflow_state_t state = workflow_state_t::failed;

   // the stage the import was in when it finished
   workflow_state_t last_stage = workflow_state_t::validating_paths;

   std::vector<file_error_t> errors;
};

//
// Runs an import from a photo volume through its stages:
//
//    validating-paths -> queuing -> copying -> reorganizing -> validating-checksums -> done | failed
//
// Copy failures for one destination do not stop copies into other
// destinations and are reported once all of them were attempted.
// A failed reorganization stops the import right away, because files
// in the staging area may no longer be where the queue expects them.
// An import ends as `done` only if no errors were recorded.
//
class import_workflow_t {
   private:
      const options_t& options;

      const file_hasher_t& file_hasher;

      metadata_source_t& metadata_source;

      command_runner_t& command_runner;

      operator_prompt_t& operator_prompt;

      print_stream_t& print_stream;

      workflow_state_t state = workflow_state_t::validating_paths;

      std::vector<file_error_t> errors;

   private:
      void enter_state(workflow_state_t next_state);

      workflow_result_t finish(workflow_state_t final_state);

      bool copy_destinations(const copy_queue_t& copy_queue, const checksum_validator_t& checksum_validator);

      bool validate_archived(const copy_queue_t& copy_queue, const move_map_t& moves, const checksum_validator_t& checksum_validator);

   public:
      import_workflow_t(const options_t& options, const file_hasher_t& file_hasher, metadata_source_t& metadata_source, command_runner_t& command_runner, operator_prompt_t& operator_prompt, print_stream_t& print_stream);

      // returns roots from options, with the source volume resolved by the caller
      static import_roots_t make_roots(const options_t& options, const std::filesystem::path& source);

      // throws `import_error_t` with `path_not_found` or `not_writable`
      static void validate_roots(const import_roots_t& roots);

      //
      // Builds a copy plan for all files on the source volume. Checksums
      // of queued files are computed in multi-buffer batches before the
      // files are queued. Files that cannot be read are recorded as errors.
      //
      std::unique_ptr<copy_queue_t> build_queue(const import_roots_t& roots, const path_builder_t& path_builder, const checksum_validator_t& checksum_validator);

      workflow_result_t run(const import_roots_t& roots);

      workflow_state_t get_state(void) const;

      const std::vector<file_error_t>& get_errors(void) const;
};

}

#endif // SDIMPORT_IMPORT_WORKFLOW_H
