#include "import_workflow.h"
#include "file_tree_walker.h"
#include "format.h"

#include <system_error>

#include <unistd.h>

using namespace std::literals::string_view_literals;

namespace sdimport {

const char *workflow_state_name(workflow_state_t state)
{
   switch(state) {
      case workflow_state_t::validating_paths:
         return "validating-paths";
      case workflow_state_t::queuing:
         return "queuing";
      case workflow_state_t::copying:
         return "copying";
      case workflow_state_t::reorganizing:
         return "reorganizing";
      case workflow_state_t::validating_checksums:
         return "validating-checksums";
      case workflow_state_t::done:
         return "done";
      case workflow_state_t::failed:
         return "failed";
   }

   return "unknown";
}

import_workflow_t::import_workflow_t(const options_t& options, const file_hasher_t& file_hasher, metadata_source_t& metadata_source, command_runner_t& command_runner, operator_prompt_t& operator_prompt, print_stream_t& print_stream) :
      options(options),
      file_hasher(file_hasher),
      metadata_source(metadata_source),
      command_runner(command_runner),
      operator_prompt(operator_prompt),
      print_stream(print_stream)
{
}

import_roots_t import_workflow_t::make_roots(const options_t& options, const std::filesystem::path& source)
{
   import_roots_t roots;

   roots.source = source;
   roots.raw = options.raw_path;
   roots.jpg = options.jpg_path;
   roots.backup = options.backup_path;
   roots.bucket = options.raw_path / options.bucket_name;

   return roots;
}

void import_workflow_t::validate_roots(const import_roots_t& roots)
{
   std::error_code errcode;

   if(!std::filesystem::is_directory(roots.source, errcode))
      throw import_error_t(error_kind_t::path_not_found, FMTNS::format("Source {:s} is not an existing directory"sv, roots.source.u8string()));

   for(const std::filesystem::path *root : {&roots.raw, &roots.jpg, &roots.backup}) {
      if(!std::filesystem::is_directory(*root, errcode))
         throw import_error_t(error_kind_t::path_not_found, FMTNS::format("Destination {:s} is not an existing directory"sv, root->u8string()));

      if(access(root->c_str(), W_OK | X_OK) != 0)
         throw import_error_t(error_kind_t::not_writable, FMTNS::format("Destination {:s} is not writable"sv, root->u8string()));
   }
}

void import_workflow_t::enter_state(workflow_state_t next_state)
{
   state = next_state;
}

workflow_result_t import_workflow_t::finish(workflow_state_t final_state)
{
   workflow_state_t last_stage = state;

   state = final_state;

   if(state == workflow_state_t::done)
      print_stream.info("Import completed successfully");
   else {
      print_stream.error("Import failed with {:d} errors", errors.size());

      // repeated at the end, so the whole list is in one place for reconciliation
      for(const file_error_t& error : errors)
         print_stream.error("  {:s}: {:s}", error_kind_name(error.kind), error.message);
   }

   return workflow_result_t{state, last_stage, errors};
}

std::unique_ptr<copy_queue_t> import_workflow_t::build_queue(const import_roots_t& roots, const path_builder_t& path_builder, const checksum_validator_t& checksum_validator)
{
   std::unique_ptr<copy_queue_t> copy_queue = std::make_unique<copy_queue_t>(roots, options.raw_extension, options.preview_extensions, path_builder, checksum_validator, print_stream);

   file_tree_walker_t file_tree_walker(print_stream);

   std::vector<std::filesystem::path> source_files = file_tree_walker.walk_tree<std::filesystem::recursive_directory_iterator>(roots.source);

   if(!file_tree_walker.was_walk_completed())
      throw import_error_t(error_kind_t::path_not_found, FMTNS::format("Cannot list all files in {:s}"sv, roots.source.u8string()));

   print_stream.info("Found {:d} files ({:s}) in {:s}", source_files.size(), hr_bytes(file_tree_walker.get_found_size()), roots.source.u8string());

   std::vector<photo_record_ptr_t> records;
   std::vector<std::filesystem::path> hashed_files;
   std::vector<size_t> hashed_records;

   for(const std::filesystem::path& source_file : source_files) {
      photo_record_ptr_t record = metadata_source.read_record(source_file);

      if(copy_queue->is_raw(*record) || copy_queue->is_preview(*record)) {
         hashed_files.push_back(source_file);
         hashed_records.push_back(records.size());
      }

      records.push_back(std::move(record));
   }

   std::vector<hash_result_t> hashes = file_hasher.hash_files(hashed_files);

   for(size_t i = 0; i < hashes.size(); i++)
      records[hashed_records[i]]->prime_content_hash(std::move(hashes[i]));

   for(const photo_record_ptr_t& record : records) {
      try {
         copy_queue->enqueue(*record);
      }
      catch (const std::exception& error) {
         print_stream.error("Cannot queue {:s} ({:s})", record->get_source_path().u8string(), error.what());
         errors.push_back({error_kind_t::copy_failed, record->get_source_path(), std::filesystem::path(), error.what()});
      }
   }

   for(const copy_queue_t::destination_map_t::value_type& destination : copy_queue->get_destinations())
      print_stream.info("Queued {:d} files ({:s}) for {:s}", destination.second.size(), hr_bytes(copy_queue->get_queued_size(destination.first)), destination.first.u8string());

   if(!copy_queue->get_skipped().empty())
      print_stream.info("Skipped {:d} raw files that are already archived", copy_queue->get_skipped().size());

   if(!copy_queue->get_unknown().empty())
      print_stream.warning("Ignored {:d} files of unknown types", copy_queue->get_unknown().size());

   return copy_queue;
}

//
// Returns `false` only if the operator declined to continue after
// a failure. Other failures are recorded as errors.
//
bool import_workflow_t::copy_destinations(const copy_queue_t& copy_queue, const checksum_validator_t& checksum_validator)
{
   std::unique_ptr<copy_backend_t> copy_backend = make_copy_backend(options.copy_tool);

   copy_executor_t copy_executor(*copy_backend, command_runner, retry_policy_t{options.max_copy_attempts, options.copy_retry_delay}, options.dry_run, print_stream);

   print_stream.info("Copying files with {:s}", copy_backend->name());

   for(const copy_queue_t::destination_map_t::value_type& destination : copy_queue.get_destinations()) {
      bool copied = false;

      try {
         if(!options.dry_run)
            std::filesystem::create_directories(destination.first);

         if(copy_backend->supports_list_copy()) {
            std::filesystem::path list_path = copy_queue.write(destination.first, options.list_dir);

            copied = copy_executor.copy_from_list(list_path, destination.first);

            if(!copied)
               errors.push_back({error_kind_t::copy_failed, std::filesystem::path(), destination.first, FMTNS::format("Cannot copy {:d} files into {:s}"sv, destination.second.size(), destination.first.u8string())});
         }
         else {
            size_t failed = 0;

            // a backend without lists copies one file at a time
            for(const queue_entry_t& entry : destination.second) {
               if(!copy_executor.copy(entry.source, entry.target)) {
                  errors.push_back({error_kind_t::copy_failed, entry.source, entry.target, FMTNS::format("Cannot copy {:s} to {:s}"sv, entry.source.u8string(), entry.target.u8string())});
                  failed++;
               }
            }

            copied = failed == 0;
         }
      }
      catch (const import_error_t& error) {
         // not a transient failure, which would be worth asking about
         print_stream.error("{:s}", error.what());
         errors.push_back({error.get_kind(), std::filesystem::path(), destination.first, error.what()});
         continue;
      }
      catch (const std::exception& error) {
         print_stream.error("Cannot copy files into {:s} ({:s})", destination.first.u8string(), error.what());
         errors.push_back({error_kind_t::copy_failed, std::filesystem::path(), destination.first, error.what()});
      }

      if(!copied) {
         if(!operator_prompt.ask_continue(FMTNS::format("Copying into {:s} failed."sv, destination.first.u8string())))
            return false;

         continue;
      }

      if(options.dry_run) {
         print_stream.info("Would validate {:d} copies in {:s}", destination.second.size(), destination.first.u8string());
         continue;
      }

      if(!checksum_validator.validate_checksums(copy_queue.get_checksums(destination.first), destination.first)) {
         errors.push_back({error_kind_t::checksum_mismatch, std::filesystem::path(), destination.first, FMTNS::format("Copies in {:s} do not match their sources"sv, destination.first.u8string())});

         if(!operator_prompt.ask_continue(FMTNS::format("Checksum validation failed for {:s}."sv, destination.first.u8string())))
            return false;
      }
   }

   return true;
}

bool import_workflow_t::validate_archived(const copy_queue_t& copy_queue, const move_map_t& moves, const checksum_validator_t& checksum_validator)
{
   std::map<std::filesystem::path, std::filesystem::path> archived;

   bool valid = true;

   for(const std::map<std::filesystem::path, std::filesystem::path>::value_type& staged : copy_queue.get_staged_sources()) {
      move_map_t::const_iterator move = moves.find(staged.first);

      if(move == moves.end()) {
         // nothing was copied into the staging area
         if(options.dry_run)
            continue;

         print_stream.error("{:s} was not found in the staging area (copied from {:s})", staged.first.u8string(), staged.second.u8string());
         errors.push_back({error_kind_t::copy_failed, staged.second, staged.first, FMTNS::format("{:s} was not staged"sv, staged.second.u8string())});
         valid = false;
         continue;
      }

      // files that could not be placed were reported by the reorganizer
      if(move->second.has_value())
         archived.emplace(staged.second, move->second.value());
   }

   if(options.dry_run) {
      print_stream.info("Would validate {:d} archived files", archived.size());
      return valid;
   }

   if(!checksum_validator.validate_checksum_list(copy_queue.get_checksums(), archived)) {
      errors.push_back({error_kind_t::checksum_mismatch, std::filesystem::path(), std::filesystem::path(), "Archived raw files do not match their sources"});
      valid = false;
   }

   return valid;
}

workflow_result_t import_workflow_t::run(const import_roots_t& roots)
{
   errors.clear();

   enter_state(workflow_state_t::validating_paths);

   try {
      validate_roots(roots);
   }
   catch (const import_error_t& error) {
      print_stream.error("{:s}", error.what());
      errors.push_back({error.get_kind(), std::filesystem::path(), std::filesystem::path(), error.what()});
      return finish(workflow_state_t::failed);
   }

   enter_state(workflow_state_t::queuing);

   path_builder_t path_builder(roots.raw, options.path_limit);
   checksum_validator_t checksum_validator(file_hasher, print_stream);

   std::unique_ptr<copy_queue_t> copy_queue;

   std::error_code errcode;

   if(!options.dry_run && !std::filesystem::create_directories(roots.bucket, errcode) && errcode) {
      print_stream.error("Cannot create a staging directory {:s} ({:s})", roots.bucket.u8string(), errcode.message());
      errors.push_back({error_kind_t::not_writable, std::filesystem::path(), roots.bucket, errcode.message()});
      return finish(workflow_state_t::failed);
   }

   try {
      copy_queue = build_queue(roots, path_builder, checksum_validator);
   }
   catch (const import_error_t& error) {
      print_stream.error("{:s}", error.what());
      errors.push_back({error.get_kind(), roots.source, std::filesystem::path(), error.what()});
      return finish(workflow_state_t::failed);
   }

   // the queue is complete and is not changed past this point
   enter_state(workflow_state_t::copying);

   if(!copy_destinations(*copy_queue, checksum_validator))
      return finish(workflow_state_t::failed);

   enter_state(workflow_state_t::reorganizing);

   reorganizer_t reorganizer(metadata_source, checksum_validator, options.path_limit, options.max_name_collisions, options.dry_run, print_stream);

   organize_result_t organize_result;

   try {
      // nothing was staged if a dry run is pointed to a new archive
      if(options.dry_run && !std::filesystem::exists(roots.bucket, errcode))
         print_stream.info("Would organize files staged in {:s}", roots.bucket.u8string());
      else
         organize_result = reorganizer.organize(roots.bucket, roots.raw);
   }
   catch (const std::exception& error) {
      print_stream.critical("Cannot organize files in {:s} ({:s})", roots.bucket.u8string(), error.what());
      errors.push_back({error_kind_t::path_not_found, roots.bucket, roots.raw, error.what()});
      return finish(workflow_state_t::failed);
   }

   errors.insert(errors.end(), organize_result.errors.begin(), organize_result.errors.end());

   if(!organize_result.completed || organize_result.count_errors(error_kind_t::not_writable)) {
      print_stream.critical("Files in {:s} were not organized completely and may need to be moved manually", roots.bucket.u8string());
      return finish(workflow_state_t::failed);
   }

   if(size_t unresolved = organize_result.count_errors(error_kind_t::name_collision_unresolved); unresolved) {
      if(!operator_prompt.ask_continue(FMTNS::format("{:d} files could not be given a unique name and remain in {:s}."sv, unresolved, roots.bucket.u8string())))
         return finish(workflow_state_t::failed);
   }

   enter_state(workflow_state_t::validating_checksums);

   validate_archived(*copy_queue, organize_result.moves, checksum_validator);

   return finish(errors.empty() ? workflow_state_t::done : workflow_state_t::failed);
}

workflow_state_t import_workflow_t::get_state(void) const
{
   return state;
}

const std::vector<file_error_t>& import_workflow_t::get_errors(void) const
{
   return errors;
}

}
