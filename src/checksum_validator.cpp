#include "checksum_validator.h"

#include <vector>
#include <system_error>

namespace sdimport {

checksum_validator_t::checksum_validator_t(const file_hasher_t& file_hasher, print_stream_t& print_stream) :
      file_hasher(file_hasher),
      print_stream(print_stream)
{
}

bool checksum_validator_t::validate_checksums(const checksum_map_t& before, const std::filesystem::path& destination_root) const
{
   std::map<std::filesystem::path, std::filesystem::path> destinations;

   for(const checksum_map_t::value_type& entry : before)
      destinations.emplace(entry.first, destination_root / entry.first.filename());

   return validate_checksum_list(before, destinations);
}

bool checksum_validator_t::validate_checksum_list(const checksum_map_t& before, const std::map<std::filesystem::path, std::filesystem::path>& destinations) const
{
   size_t failed = 0;

   std::vector<checksum_map_t::const_iterator> sources;
   std::vector<std::filesystem::path> copies;

   for(const std::map<std::filesystem::path, std::filesystem::path>::value_type& entry : destinations) {
      checksum_map_t::const_iterator source = before.find(entry.first);

      if(source == before.end()) {
         print_stream.error("No checksum was recorded for {:s} (copied to {:s})", entry.first.u8string(), entry.second.u8string());
         failed++;
         continue;
      }

      std::error_code errcode;

      if(!std::filesystem::is_regular_file(entry.second, errcode)) {
         print_stream.error("Missing {:s} (copied from {:s})", entry.second.u8string(), entry.first.u8string());
         failed++;
         continue;
      }

      sources.push_back(source);
      copies.push_back(entry.second);
   }

   // hash all copies in one multi-buffer batch
   std::vector<hash_result_t> results = file_hasher.hash_files(copies);

   for(size_t i = 0; i < copies.size(); i++) {
      if(!results[i].digest.has_value()) {
         print_stream.error("Cannot validate {:s} ({:s})", copies[i].u8string(), results[i].error);
         failed++;
      }
      else if(results[i].digest.value() != sources[i]->second) {
         print_stream.error("Checksum mismatch for {:s} (copied from {:s}): {:s} != {:s}", copies[i].u8string(), sources[i]->first.u8string(), results[i].digest.value(), sources[i]->second);
         failed++;
      }
   }

   if(failed)
      print_stream.error("Checksum validation failed for {:d} of {:d} files", failed, destinations.size());

   return !failed;
}

bool checksum_validator_t::compare_checksums(const std::filesystem::path& path_a, const std::filesystem::path& path_b) const
{
   std::error_code errcode;

   if(!std::filesystem::is_regular_file(path_a, errcode) || !std::filesystem::is_regular_file(path_b, errcode))
      return false;

   // files of different sizes cannot have the same content
   if(std::filesystem::file_size(path_a) != std::filesystem::file_size(path_b))
      return false;

   std::vector<hash_result_t> results = file_hasher.hash_files({path_a, path_b});

   if(!results[0].digest.has_value() || !results[1].digest.has_value()) {
      print_stream.warning("Cannot compare {:s} and {:s} ({:s})", path_a.u8string(), path_b.u8string(), results[0].digest.has_value() ? results[1].error : results[0].error);
      return false;
   }

   return results[0].digest.value() == results[1].digest.value();
}

bool checksum_validator_t::compare_checksum(const std::filesystem::path& filepath, const std::string& checksum) const
{
   std::error_code errcode;

   if(!std::filesystem::is_regular_file(filepath, errcode))
      return false;

   std::vector<hash_result_t> results = file_hasher.hash_files({filepath});

   if(!results.front().digest.has_value()) {
      print_stream.warning("Cannot hash {:s} ({:s})", filepath.u8string(), results.front().error);
      return false;
   }

   return results.front().digest.value() == checksum;
}

}
