#include "test_files.h"

#include "../copy_queue.h"

#include <string>
#include <algorithm>

using namespace std::literals::string_literals;

namespace sdimport {
namespace test {

class copy_queue_test_t : public temp_dir_test_t {
   protected:
      file_hasher_t file_hasher;

      print_stream_t print_stream;

      checksum_validator_t checksum_validator;

      fake_metadata_source_t metadata_source;

      import_roots_t roots;

      std::unique_ptr<path_builder_t> path_builder;

      std::unique_ptr<copy_queue_t> copy_queue;

   protected:
      copy_queue_test_t(void) :
            file_hasher(4096, 4),
            checksum_validator(file_hasher, print_stream),
            metadata_source(file_hasher)
      {
      }

      void SetUp(void) override
      {
         temp_dir_test_t::SetUp();

         roots.source = temp_dir / "card";
         roots.raw = temp_dir / "raw";
         roots.jpg = temp_dir / "jpg";
         roots.backup = temp_dir / "backup";
         roots.bucket = roots.raw / "Import Bucket";

         path_builder = std::make_unique<path_builder_t>(roots.raw, 254);

         copy_queue = std::make_unique<copy_queue_t>(roots, "arw"s, std::vector<std::string>{"jpg"s, "jpeg"s}, *path_builder, checksum_validator, print_stream);

         metadata_source.set_attributes("DSC00001.ARW", make_attributes(2023, 8, 5, "a7r4"));
      }

      photo_record_ptr_t card_file(const std::filesystem::path& subpath, std::string_view content)
      {
         return metadata_source.read_record(write_file(roots.source / subpath, content));
      }

      static std::vector<std::filesystem::path> sources(const std::vector<queue_entry_t>& entries)
      {
         std::vector<std::filesystem::path> paths;

         for(const queue_entry_t& entry : entries)
            paths.push_back(entry.source);

         return paths;
      }
};

TEST_F(copy_queue_test_t, subpath_test)
{
   ASSERT_EQ(std::filesystem::path("100MSDCF"), copy_queue->get_subpath(roots.source / "DCIM" / "100MSDCF" / "DSC00001.ARW"));
   ASSERT_EQ(std::filesystem::path("100MSDCF"), copy_queue->get_subpath(roots.source / "dcim" / "100MSDCF" / "DSC00001.ARW"));
   ASSERT_EQ(std::filesystem::path("PRIVATE/M4ROOT"), copy_queue->get_subpath(roots.source / "PRIVATE" / "M4ROOT" / "x.jpg"));
   ASSERT_EQ(std::filesystem::path(), copy_queue->get_subpath(roots.source / "DSC00001.ARW"));

   ASSERT_EQ(std::filesystem::path("DCIM/100MSDCF"), copy_queue->get_backup_subpath(roots.source / "DCIM" / "100MSDCF" / "DSC00001.ARW"));
}

TEST_F(copy_queue_test_t, route_by_type_test)
{
   photo_record_ptr_t raw = card_file("DCIM/100MSDCF/DSC00001.ARW", "raw");
   photo_record_ptr_t jpg = card_file("DCIM/100MSDCF/DSC00001.JPG", "jpg");
   photo_record_ptr_t txt = card_file("DCIM/100MSDCF/notes.txt", "txt");

   copy_queue->enqueue(*raw);
   copy_queue->enqueue(*jpg);
   copy_queue->enqueue(*txt);

   const copy_queue_t::destination_map_t& destinations = copy_queue->get_destinations();

   ASSERT_EQ(3u, destinations.size());

   ASSERT_EQ(std::vector<std::filesystem::path>{raw->get_source_path()}, sources(destinations.at(roots.bucket / "100MSDCF")));
   ASSERT_EQ(std::vector<std::filesystem::path>{jpg->get_source_path()}, sources(destinations.at(roots.jpg / "100MSDCF")));

   // every queued file is backed up exactly once
   std::vector<std::filesystem::path> backup = sources(destinations.at(roots.backup / "DCIM" / "100MSDCF"));
   std::sort(backup.begin(), backup.end());

   ASSERT_EQ((std::vector<std::filesystem::path>{raw->get_source_path(), jpg->get_source_path()}), backup);

   ASSERT_EQ(std::vector<std::filesystem::path>{txt->get_source_path()}, copy_queue->get_unknown());
   ASSERT_FALSE(copy_queue->get_checksums().contains(txt->get_source_path()));

   ASSERT_EQ(2u, copy_queue->get_checksums().size());
   ASSERT_EQ(6u, copy_queue->get_queued_size(roots.backup / "DCIM" / "100MSDCF"));

   ASSERT_EQ(roots.bucket / "100MSDCF" / "DSC00001.ARW", copy_queue->get_staged_sources().begin()->first);
}

TEST_F(copy_queue_test_t, duplicate_enqueue_test)
{
   photo_record_ptr_t jpg = card_file("DCIM/100MSDCF/DSC00002.JPG", "jpg");

   copy_queue->enqueue(*jpg);
   copy_queue->enqueue(*jpg);

   ASSERT_EQ(1u, copy_queue->get_destinations().at(roots.jpg / "100MSDCF").size());
   ASSERT_EQ(1u, copy_queue->get_destinations().at(roots.backup / "DCIM" / "100MSDCF").size());
}

TEST_F(copy_queue_test_t, archived_raw_skipped_test)
{
   photo_record_ptr_t raw = card_file("DCIM/100MSDCF/DSC00001.ARW", "raw");

   write_file(path_builder->generate_path(*raw), "raw");

   copy_queue->enqueue(*raw);

   ASSERT_TRUE(copy_queue->get_skipped().contains(raw->get_source_path()));
   ASSERT_FALSE(copy_queue->get_destinations().contains(roots.bucket / "100MSDCF"));

   // the backup is still made
   ASSERT_TRUE(copy_queue->get_destinations().contains(roots.backup / "DCIM" / "100MSDCF"));
   ASSERT_TRUE(copy_queue->get_staged_sources().empty());
}

TEST_F(copy_queue_test_t, different_archived_raw_test)
{
   photo_record_ptr_t raw = card_file("DCIM/100MSDCF/DSC00001.ARW", "raw");

   std::filesystem::path canonical_path = write_file(path_builder->generate_path(*raw), "other");

   copy_queue->enqueue(*raw);

   ASSERT_TRUE(copy_queue->get_skipped().empty());
   ASSERT_EQ(raw->get_source_path(), copy_queue->get_mismatched().at(canonical_path));
   ASSERT_TRUE(copy_queue->get_destinations().contains(roots.bucket / "100MSDCF"));
}

TEST_F(copy_queue_test_t, unreadable_source_test)
{
   photo_record_ptr_t raw = metadata_source.read_record(roots.source / "DCIM" / "100MSDCF" / "DSC00009.ARW");

   ASSERT_THROW(copy_queue->enqueue(*raw), std::runtime_error);
   ASSERT_TRUE(copy_queue->get_destinations().empty());
}

TEST_F(copy_queue_test_t, write_list_test)
{
   photo_record_ptr_t jpg1 = card_file("DCIM/100MSDCF/DSC00001.JPG", "1");
   photo_record_ptr_t jpg2 = card_file("DCIM/100MSDCF/DSC00002.JPG", "2");

   copy_queue->enqueue(*jpg1);
   copy_queue->enqueue(*jpg2);

   std::filesystem::path list_path = copy_queue->write(roots.jpg / "100MSDCF", temp_dir / "lists");

   ASSERT_EQ(temp_dir / "lists", list_path.parent_path());
   ASSERT_EQ(jpg1->get_source_path().string() + "\n" + jpg2->get_source_path().string() + "\n", read_file(list_path));

   // same destination reuses the same list file
   ASSERT_EQ(list_path, copy_queue->write(roots.jpg / "100MSDCF", temp_dir / "lists"));

   ASSERT_THROW(copy_queue->write(roots.jpg / "101MSDCF", temp_dir / "lists"), std::runtime_error);
}

TEST_F(copy_queue_test_t, plan_json_test)
{
   copy_queue->enqueue(*card_file("DCIM/100MSDCF/DSC00001.JPG", "1"));
   copy_queue->enqueue(*card_file("DCIM/100MSDCF/notes.txt", "2"));

   std::string json = copy_queue->to_json();

   ASSERT_NE(std::string::npos, json.find("\"destinations\""));
   ASSERT_NE(std::string::npos, json.find((roots.jpg / "100MSDCF").generic_string()));
   ASSERT_NE(std::string::npos, json.find("notes.txt"));
   ASSERT_NE(std::string::npos, json.find("\"hr_size\": \"1 byte\""));
}

}
}
