#ifndef SDIMPORT_VOLUME_LOCATOR_H
#define SDIMPORT_VOLUME_LOCATOR_H

#include "print_stream.h"

#include <filesystem>
#include <optional>
#include <vector>

namespace sdimport {

//
// Resolves the mount point of a removable photo volume.
//
class volume_locator_t {
   public:
      virtual ~volume_locator_t(void) = default;

      virtual std::optional<std::filesystem::path> find_volume(void) = 0;
};

//
// Looks for the first mounted volume with a camera folder (DCIM)
// under the media directories where desktop environments mount
// removable volumes (e.g. `/media/user/SDCARD` or
// `/run/media/user/SDCARD`).
//
class media_volume_locator_t : public volume_locator_t {
   private:
      std::vector<std::filesystem::path> media_dirs;

      print_stream_t& print_stream;

   public:
      static std::vector<std::filesystem::path> default_media_dirs(void);

      media_volume_locator_t(std::vector<std::filesystem::path>&& media_dirs, print_stream_t& print_stream);

      std::optional<std::filesystem::path> find_volume(void) override;
};

}

#endif // SDIMPORT_VOLUME_LOCATOR_H
