#include "test_files.h"

#include "../import_workflow.h"

#include <string>
#include <fstream>
#include <vector>
#include <algorithm>

using namespace std::literals::string_view_literals;
using namespace std::literals::string_literals;

namespace sdimport {
namespace test {

//
// Copies files named in a list file into the destination directory,
// skipping existing files, like `rsync --files-from --ignore-existing`
// would. Commands without a list file copy the next to last argument
// to the last one, like `cp -n -T` would. If `fail` is set, nothing is
// copied and a failure is returned. If `corrupt` is set, copies do not
// have the content of their sources.
//
class copy_runner_t : public command_runner_t {
   public:
      size_t runs = 0;

      bool fail = false;

      bool corrupt = false;

   private:
      void copy_file(const std::filesystem::path& source, const std::filesystem::path& target)
      {
         if(std::filesystem::exists(target))
            return;

         if(corrupt)
            std::ofstream(target, std::ios::binary) << "corrupted";
         else
            std::filesystem::copy_file(source, target);
      }

   public:
      int run(const std::vector<std::string>& args) override
      {
         runs++;

         if(fail)
            return 23;

         if(args.size() < 2)
            return 1;

         std::filesystem::path list_path;

         for(const std::string& arg : args) {
            if(arg.starts_with("--files-from="sv))
               list_path = arg.substr(13);
         }

         if(list_path.empty()) {
            copy_file(args[args.size() - 2], args.back());
            return 0;
         }

         std::filesystem::path destination = args.back();

         std::ifstream list_file(list_path);
         std::string source;

         while(std::getline(list_file, source))
            copy_file(source, destination / std::filesystem::path(source).filename());

         return 0;
      }
};

//
// Answers every question the same way and counts questions.
//
class counting_prompt_t : public operator_prompt_t {
   public:
      std::vector<std::string> questions;

      bool answer;

   public:
      counting_prompt_t(bool answer) :
            answer(answer)
      {
      }

      bool ask_continue(const std::string& question) override
      {
         questions.push_back(question);
         return answer;
      }
};

class import_workflow_test_t : public temp_dir_test_t {
   protected:
      options_t options;

      file_hasher_t file_hasher;

      print_stream_t print_stream;

      fake_metadata_source_t metadata_source;

      copy_runner_t runner;

      import_roots_t roots;

      std::filesystem::path raw_source;
      std::filesystem::path jpg_source;
      std::filesystem::path txt_source;

   protected:
      import_workflow_test_t(void) :
            file_hasher(4096, 4),
            metadata_source(file_hasher)
      {
      }

      void SetUp(void) override
      {
         temp_dir_test_t::SetUp();

         options.raw_path = temp_dir / "raw";
         options.jpg_path = temp_dir / "jpg";
         options.backup_path = temp_dir / "backup";
         options.list_dir = temp_dir / "lists";
         options.copy_retry_delay = std::chrono::seconds(0);

         for(const std::filesystem::path& root : {options.raw_path, options.jpg_path, options.backup_path})
            std::filesystem::create_directories(root);

         roots = import_workflow_t::make_roots(options, temp_dir / "card");

         raw_source = write_file(roots.source / "DCIM" / "100MSDCF" / "DSC00001.ARW", "raw");
         jpg_source = write_file(roots.source / "DCIM" / "100MSDCF" / "DSC00001.JPG", "jpg");
         txt_source = write_file(roots.source / "DCIM" / "100MSDCF" / "notes.txt", "txt");

         metadata_source.set_attributes("DSC00001.ARW", make_attributes(2023, 8, 5, "a7r4"));
      }

      std::filesystem::path archived_raw(void)
      {
         return path_builder_t(roots.raw, options.path_limit).generate_path(*metadata_source.read_record(raw_source));
      }

      workflow_result_t run_import(operator_prompt_t& operator_prompt)
      {
         import_workflow_t import_workflow(options, file_hasher, metadata_source, runner, operator_prompt, print_stream);

         workflow_result_t result = import_workflow.run(roots);

         EXPECT_EQ(result.state, import_workflow.get_state());

         return result;
      }
};

TEST(workflow_state_suite, state_name_test)
{
   ASSERT_STREQ("validating-paths", workflow_state_name(workflow_state_t::validating_paths));
   ASSERT_STREQ("validating-checksums", workflow_state_name(workflow_state_t::validating_checksums));
   ASSERT_STREQ("done", workflow_state_name(workflow_state_t::done));
}

TEST_F(import_workflow_test_t, make_roots_test)
{
   ASSERT_EQ(temp_dir / "card", roots.source);
   ASSERT_EQ(options.raw_path / "Import Bucket", roots.bucket);
}

TEST_F(import_workflow_test_t, complete_import_test)
{
   auto_prompt_t operator_prompt(false);

   workflow_result_t result = run_import(operator_prompt);

   ASSERT_EQ(workflow_state_t::done, result.state);
   ASSERT_TRUE(result.errors.empty());

   // raw staging, jpeg and backup
   ASSERT_EQ(3u, runner.runs);

   ASSERT_EQ(std::vector<std::filesystem::path>{archived_raw().lexically_relative(roots.raw)}, list_files(roots.raw));
   ASSERT_EQ("raw"s, read_file(archived_raw()));

   ASSERT_EQ(std::vector<std::filesystem::path>{"100MSDCF/DSC00001.JPG"}, list_files(roots.jpg));

   ASSERT_EQ((std::vector<std::filesystem::path>{"DCIM/100MSDCF/DSC00001.ARW", "DCIM/100MSDCF/DSC00001.JPG"}), list_files(roots.backup));
}

TEST_F(import_workflow_test_t, repeated_import_test)
{
   auto_prompt_t operator_prompt(false);

   ASSERT_EQ(workflow_state_t::done, run_import(operator_prompt).state);
   ASSERT_EQ(workflow_state_t::done, run_import(operator_prompt).state);

   // the archived raw file is not staged again
   ASSERT_EQ(5u, runner.runs);

   ASSERT_EQ(std::vector<std::filesystem::path>{archived_raw().lexically_relative(roots.raw)}, list_files(roots.raw));
   ASSERT_EQ(2u, list_files(roots.backup).size());
}

TEST_F(import_workflow_test_t, missing_destination_test)
{
   std::filesystem::remove(options.jpg_path);

   auto_prompt_t operator_prompt(true);

   workflow_result_t result = run_import(operator_prompt);

   ASSERT_EQ(workflow_state_t::failed, result.state);
   ASSERT_EQ(1u, result.errors.size());
   ASSERT_EQ(error_kind_t::path_not_found, result.errors.front().kind);
   ASSERT_EQ(0u, runner.runs);
}

TEST_F(import_workflow_test_t, copy_failure_declined_test)
{
   runner.fail = true;

   auto_prompt_t operator_prompt(false);

   workflow_result_t result = run_import(operator_prompt);

   ASSERT_EQ(workflow_state_t::failed, result.state);

   // the operator declined after the first destination failed
   ASSERT_EQ(workflow_state_t::copying, result.last_stage);
   ASSERT_EQ(options.max_copy_attempts, runner.runs);
   ASSERT_EQ(error_kind_t::copy_failed, result.errors.front().kind);
}

TEST_F(import_workflow_test_t, copy_failure_continued_test)
{
   runner.fail = true;

   auto_prompt_t operator_prompt(true);

   workflow_result_t result = run_import(operator_prompt);

   ASSERT_EQ(workflow_state_t::failed, result.state);

   // every destination is attempted
   ASSERT_EQ(3 * options.max_copy_attempts, runner.runs);
   ASSERT_EQ(3, std::count_if(result.errors.begin(), result.errors.end(), [] (const file_error_t& error) {return error.kind == error_kind_t::copy_failed && error.source.empty();}));
}

TEST_F(import_workflow_test_t, dry_run_test)
{
   options.dry_run = true;

   auto_prompt_t operator_prompt(true);

   workflow_result_t result = run_import(operator_prompt);

   // list copies cannot be simulated
   ASSERT_EQ(workflow_state_t::failed, result.state);
   ASSERT_EQ(error_kind_t::unsupported_operation, result.errors.front().kind);

   ASSERT_EQ(0u, runner.runs);
   ASSERT_FALSE(std::filesystem::exists(roots.bucket));
   ASSERT_TRUE(list_files(roots.jpg).empty());
}

TEST_F(import_workflow_test_t, file_copy_backend_test)
{
   options.copy_tool = "cp"s;

   auto_prompt_t operator_prompt(false);

   workflow_result_t result = run_import(operator_prompt);

   ASSERT_EQ(workflow_state_t::done, result.state);
   ASSERT_TRUE(result.errors.empty());

   // one command per file for raw staging, jpeg and backup
   ASSERT_EQ(4u, runner.runs);

   ASSERT_EQ("raw"s, read_file(archived_raw()));
   ASSERT_EQ(std::vector<std::filesystem::path>{"100MSDCF/DSC00001.JPG"}, list_files(roots.jpg));
   ASSERT_EQ(2u, list_files(roots.backup).size());
}

TEST_F(import_workflow_test_t, file_copy_dry_run_test)
{
   options.copy_tool = "cp"s;
   options.dry_run = true;

   auto_prompt_t operator_prompt(false);

   workflow_result_t result = run_import(operator_prompt);

   // file copies are only logged and there is nothing to validate
   ASSERT_EQ(workflow_state_t::done, result.state);
   ASSERT_TRUE(result.errors.empty());

   ASSERT_EQ(0u, runner.runs);
   ASSERT_FALSE(std::filesystem::exists(roots.bucket));
   ASSERT_TRUE(list_files(roots.jpg).empty());
   ASSERT_TRUE(list_files(roots.backup).empty());
}

TEST_F(import_workflow_test_t, checksum_mismatch_declined_test)
{
   runner.corrupt = true;

   counting_prompt_t operator_prompt(false);

   workflow_result_t result = run_import(operator_prompt);

   ASSERT_EQ(workflow_state_t::failed, result.state);
   ASSERT_EQ(workflow_state_t::copying, result.last_stage);

   // the copy command succeeded, but the copies are different
   ASSERT_EQ(1u, runner.runs);
   ASSERT_EQ(1u, operator_prompt.questions.size());
   ASSERT_TRUE(operator_prompt.questions.front().starts_with("Checksum validation failed"sv));

   ASSERT_EQ(1u, result.errors.size());
   ASSERT_EQ(error_kind_t::checksum_mismatch, result.errors.front().kind);
}

TEST_F(import_workflow_test_t, reorganize_not_writable_test)
{
   // a file where the year folder should be
   write_file(roots.raw / "2023", "blocked");

   counting_prompt_t operator_prompt(true);

   workflow_result_t result = run_import(operator_prompt);

   ASSERT_EQ(workflow_state_t::failed, result.state);
   ASSERT_EQ(workflow_state_t::reorganizing, result.last_stage);

   ASSERT_EQ(1u, result.errors.size());
   ASSERT_EQ(error_kind_t::not_writable, result.errors.front().kind);
   ASSERT_TRUE(operator_prompt.questions.empty());

   // the staged file stays in the staging area
   ASSERT_EQ(std::vector<std::filesystem::path>{"100MSDCF/DSC00001.ARW"}, list_files(roots.bucket));
}

TEST_F(import_workflow_test_t, build_queue_test)
{
   auto_prompt_t operator_prompt(false);

   import_workflow_t import_workflow(options, file_hasher, metadata_source, runner, operator_prompt, print_stream);

   path_builder_t path_builder(roots.raw, options.path_limit);
   checksum_validator_t checksum_validator(file_hasher, print_stream);

   std::unique_ptr<copy_queue_t> copy_queue = import_workflow.build_queue(roots, path_builder, checksum_validator);

   ASSERT_EQ(3u, copy_queue->get_destinations().size());
   ASSERT_EQ(std::vector<std::filesystem::path>{txt_source}, copy_queue->get_unknown());
   ASSERT_EQ(file_hasher.hash_file(raw_source), copy_queue->get_checksums().at(raw_source));
   ASSERT_TRUE(import_workflow.get_errors().empty());
}

}
}
