#include "test_files.h"

#include "../reorganizer.h"

#include <string>

using namespace std::literals::string_literals;

namespace sdimport {
namespace test {

class reorganizer_test_t : public temp_dir_test_t {
   protected:
      file_hasher_t file_hasher;

      print_stream_t print_stream;

      checksum_validator_t checksum_validator;

      fake_metadata_source_t metadata_source;

      std::filesystem::path staging_root;
      std::filesystem::path archive_root;

   protected:
      reorganizer_test_t(void) :
            file_hasher(4096, 4),
            checksum_validator(file_hasher, print_stream),
            metadata_source(file_hasher)
      {
      }

      void SetUp(void) override
      {
         temp_dir_test_t::SetUp();

         archive_root = temp_dir / "raw";
         staging_root = archive_root / "Import Bucket";

         std::filesystem::create_directories(staging_root);

         metadata_source.set_attributes("DSC00001.ARW", make_attributes(2023, 8, 5, "a7r4"));
      }

      std::filesystem::path canonical_path(const std::filesystem::path& staged_path)
      {
         return path_builder_t(archive_root, 254).generate_path(*metadata_source.read_record(staged_path));
      }
};

TEST_F(reorganizer_test_t, move_to_dated_folder_test)
{
   std::filesystem::path staged = write_file(staging_root / "100MSDCF" / "DSC00001.ARW", "raw");
   std::filesystem::path expected = canonical_path(staged);

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, false, print_stream);

   organize_result_t result = reorganizer.organize(staging_root, archive_root);

   ASSERT_TRUE(result.completed);
   ASSERT_TRUE(result.errors.empty());
   ASSERT_EQ(expected, result.moves.at(staged).value());

   ASSERT_EQ(archive_root / "2023" / "2023-08-05", expected.parent_path());
   ASSERT_EQ("raw"s, read_file(expected));
   ASSERT_FALSE(std::filesystem::exists(staged));
}

TEST_F(reorganizer_test_t, identical_archived_file_test)
{
   std::filesystem::path staged = write_file(staging_root / "DSC00001.ARW", "raw");
   std::filesystem::path expected = write_file(canonical_path(staged), "raw");

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, false, print_stream);

   organize_result_t result = reorganizer.organize(staging_root, archive_root);

   ASSERT_TRUE(result.errors.empty());
   ASSERT_EQ(expected, result.moves.at(staged).value());

   // one copy remains in the archive and none in the staging area
   ASSERT_EQ(std::vector<std::filesystem::path>{expected.lexically_relative(archive_root)}, list_files(archive_root));
}

TEST_F(reorganizer_test_t, name_collision_test)
{
   std::filesystem::path staged = write_file(staging_root / "DSC00001.ARW", "new");
   std::filesystem::path existing = write_file(canonical_path(staged), "old");

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, false, print_stream);

   organize_result_t result = reorganizer.organize(staging_root, archive_root);

   std::filesystem::path disambiguated = existing.parent_path() / (existing.stem().string() + " (1)" + existing.extension().string());

   ASSERT_TRUE(result.errors.empty());
   ASSERT_EQ(disambiguated, result.moves.at(staged).value());
   ASSERT_EQ("old"s, read_file(existing));
   ASSERT_EQ("new"s, read_file(disambiguated));
}

TEST_F(reorganizer_test_t, unresolved_collision_test)
{
   std::filesystem::path staged = write_file(staging_root / "DSC00001.ARW", "new");
   std::filesystem::path existing = write_file(canonical_path(staged), "old");

   write_file(existing.parent_path() / (existing.stem().string() + " (1)" + existing.extension().string()), "older");

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1, false, print_stream);

   organize_result_t result = reorganizer.organize(staging_root, archive_root);

   ASSERT_EQ(1u, result.count_errors(error_kind_t::name_collision_unresolved));
   ASSERT_FALSE(result.moves.at(staged).has_value());

   // the file stays in the staging area for the operator
   ASSERT_EQ("new"s, read_file(staged));
}

TEST_F(reorganizer_test_t, dry_run_test)
{
   std::filesystem::path staged = write_file(staging_root / "DSC00001.ARW", "raw");
   std::filesystem::path expected = canonical_path(staged);

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, true, print_stream);

   organize_result_t result = reorganizer.organize(staging_root, archive_root);

   ASSERT_EQ(expected, result.moves.at(staged).value());
   ASSERT_TRUE(std::filesystem::exists(staged));
   ASSERT_FALSE(std::filesystem::exists(expected.parent_path()));
}

TEST_F(reorganizer_test_t, path_too_long_test)
{
   std::filesystem::path staged = write_file(staging_root / "DSC00001.ARW", "raw");

   reorganizer_t reorganizer(metadata_source, checksum_validator, archive_root.string().size() + 10, 1000, false, print_stream);

   organize_result_t result = reorganizer.organize(staging_root, archive_root);

   ASSERT_EQ(1u, result.count_errors(error_kind_t::path_too_long));
   ASSERT_TRUE(std::filesystem::exists(staged));
}

TEST_F(reorganizer_test_t, missing_staging_test)
{
   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, false, print_stream);

   try {
      reorganizer.organize(temp_dir / "missing", archive_root);
      FAIL() << "A missing staging area should be rejected";
   }
   catch (const import_error_t& error) {
      ASSERT_EQ(error_kind_t::path_not_found, error.get_kind());
   }
}

TEST_F(reorganizer_test_t, legacy_name_test)
{
   metadata_source.set_attributes("20230805-ILCE7RM4-01234-m2.7EB.arw", make_attributes(2023, 8, 5, "a7r4"));

   std::filesystem::path day_dir = archive_root / "2023" / "2023-08-05";

   std::filesystem::path legacy = write_file(day_dir / "20230805-ILCE7RM4-01234-m2.7EB.arw", "raw");
   std::filesystem::path current = write_file(day_dir / "20230805_a7r4_01235_EBEB_EVEV_BB_ISOISO_SSSS_.arw", "raw");

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, false, print_stream);

   organize_result_t result = reorganizer.migrate_legacy_names(archive_root, staging_root, "arw"s);

   std::filesystem::path renamed = day_dir / "20230805_a7r4_01234_EBEB_EVEV_BB_ISOISO_SSSS_.arw";

   ASSERT_TRUE(result.errors.empty());
   ASSERT_EQ(1u, result.moves.size());
   ASSERT_EQ(renamed, result.moves.at(legacy).value());

   ASSERT_TRUE(std::filesystem::exists(renamed));
   ASSERT_FALSE(std::filesystem::exists(legacy));
   ASSERT_TRUE(std::filesystem::exists(current));
}

TEST_F(reorganizer_test_t, legacy_name_exists_test)
{
   metadata_source.set_attributes("20230805-ILCE7RM4-01234-m2.7EB.arw", make_attributes(2023, 8, 5, "a7r4"));

   std::filesystem::path day_dir = archive_root / "2023" / "2023-08-05";

   std::filesystem::path legacy = write_file(day_dir / "20230805-ILCE7RM4-01234-m2.7EB.arw", "raw");
   std::filesystem::path taken = write_file(day_dir / "20230805_a7r4_01234_EBEB_EVEV_BB_ISOISO_SSSS_.arw", "other");

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, false, print_stream);

   organize_result_t result = reorganizer.migrate_legacy_names(archive_root, staging_root, "arw"s);

   std::filesystem::path renamed = day_dir / "20230805_a7r4_01234_EBEB_EVEV_BB_ISOISO_SSSS_ (1).arw";

   ASSERT_TRUE(result.errors.empty());
   ASSERT_EQ(renamed, result.moves.at(legacy).value());

   ASSERT_EQ("raw"s, read_file(renamed));
   ASSERT_EQ("other"s, read_file(taken));
}

TEST_F(reorganizer_test_t, legacy_name_short_fallback_test)
{
   metadata_source.set_attributes("20230805-ILCE7RM4-01234-m2.7EB.arw", make_attributes(2023, 8, 5, "a7r4"));

   std::filesystem::path day_dir = archive_root / "2023" / "2023-08-05";

   std::filesystem::path legacy = write_file(day_dir / "20230805-ILCE7RM4-01234-m2.7EB.arw", "raw");

   // room for the 22-byte short name, but not for the 49-byte full one
   size_t path_limit = day_dir.generic_u8string().size() + 1 + 30;

   reorganizer_t reorganizer(metadata_source, checksum_validator, path_limit, 1000, false, print_stream);

   organize_result_t result = reorganizer.migrate_legacy_names(archive_root, staging_root, "arw"s);

   std::filesystem::path renamed = day_dir / "01234_EBEB_EVEV_BB.arw";

   ASSERT_TRUE(result.errors.empty());
   ASSERT_EQ(renamed, result.moves.at(legacy).value());
   ASSERT_LE(renamed.u8string().size(), path_limit);
   ASSERT_TRUE(std::filesystem::exists(renamed));
}

TEST_F(reorganizer_test_t, legacy_name_staging_skipped_test)
{
   metadata_source.set_attributes("20230805-ILCE7RM4-01234-m2.7EB.arw", make_attributes(2023, 8, 5, "a7r4"));

   std::filesystem::path staged = write_file(staging_root / "100MSDCF" / "20230805-ILCE7RM4-01234-m2.7EB.arw", "raw");

   reorganizer_t reorganizer(metadata_source, checksum_validator, 254, 1000, false, print_stream);

   organize_result_t result = reorganizer.migrate_legacy_names(archive_root, staging_root, "arw"s);

   ASSERT_TRUE(result.errors.empty());
   ASSERT_TRUE(result.moves.empty());
   ASSERT_TRUE(std::filesystem::exists(staged));
}

}
}
