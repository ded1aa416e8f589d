#include "volume_locator.h"

#include <set>
#include <system_error>
#include <cstdlib>

namespace sdimport {

std::vector<std::filesystem::path> media_volume_locator_t::default_media_dirs(void)
{
   std::vector<std::filesystem::path> media_dirs;

   const char *user = std::getenv("USER");

   if(user && *user) {
      media_dirs.push_back(std::filesystem::path("/media") / user);
      media_dirs.push_back(std::filesystem::path("/run/media") / user);
   }

   media_dirs.push_back("/media");

   return media_dirs;
}

media_volume_locator_t::media_volume_locator_t(std::vector<std::filesystem::path>&& media_dirs, print_stream_t& print_stream) :
      media_dirs(std::move(media_dirs)),
      print_stream(print_stream)
{
}

std::optional<std::filesystem::path> media_volume_locator_t::find_volume(void)
{
   for(const std::filesystem::path& media_dir : media_dirs) {
      std::error_code errcode;

      if(!std::filesystem::is_directory(media_dir, errcode))
         continue;

      // directory order is unspecified, so volumes are checked by name
      std::set<std::filesystem::path> volumes;

      for(std::filesystem::directory_iterator dir_it(media_dir, errcode), end; !errcode && dir_it != end; dir_it.increment(errcode)) {
         std::error_code entry_errcode;

         if(dir_it->is_directory(entry_errcode))
            volumes.insert(dir_it->path());
      }

      if(errcode)
         print_stream.warning("Cannot list volumes in {:s} ({:s})", media_dir.u8string(), errcode.message());

      for(const std::filesystem::path& volume : volumes) {
         if(std::filesystem::is_directory(volume / "DCIM", errcode)) {
            print_stream.info("Found a photo volume in {:s}", volume.u8string());
            return volume;
         }
      }
   }

   return std::nullopt;
}

}
