#ifndef SDIMPORT_PRINT_STREAM_H
#define SDIMPORT_PRINT_STREAM_H

#include "format.h"

#include <mutex>
#include <atomic>
#include <fstream>
#include <iostream>

#include <string>

namespace sdimport {

//
// A logging sink that prints messages to the console and, if a log
// file was opened, appends them to the log file with a time stamp
// and a severity prefix. A single instance is created at start-up
// and passed into all components that report progress or errors.
//
class print_stream_t {
   private:
      std::mutex     print_mtx;
      std::ofstream  log_stream;

      std::atomic<size_t> error_count = 0;

   private:
      void print(std::basic_ostream<char>& stream, const char* prefix, const FMTNS::string_view& fmt, FMTNS::format_args args);

   public:
      print_stream_t(void);

      print_stream_t(std::ofstream&& log_stream);

      ~print_stream_t(void);

      size_t get_error_count(void) const;

      template <typename... Args>
      void info(const FMTNS::format_string<Args...>& fmt, Args&&... args)
      {
         print(std::cout, "inf", FMTSV(fmt), FMTNS::make_format_args(args...));
      }

      template <typename... Args>
      void warning(const FMTNS::format_string<Args...>& fmt, Args&&... args)
      {
         print(std::cout, "wrn", FMTSV(fmt), FMTNS::make_format_args(args...));
      }

      template <typename... Args>
      void error(const FMTNS::format_string<Args...>& fmt, Args&&... args)
      {
         error_count++;
         print(std::cerr, "err", FMTSV(fmt), FMTNS::make_format_args(args...));
      }

      // reported for failures that leave the archive in an inconsistent state
      template <typename... Args>
      void critical(const FMTNS::format_string<Args...>& fmt, Args&&... args)
      {
         error_count++;
         print(std::cerr, "crt", FMTSV(fmt), FMTNS::make_format_args(args...));
      }
};

}

#endif // SDIMPORT_PRINT_STREAM_H
