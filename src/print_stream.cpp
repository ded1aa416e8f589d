#include "print_stream.h"

#include <ctime>
#include <iterator>

namespace sdimport {

print_stream_t::print_stream_t(void)
{
}

print_stream_t::print_stream_t(std::ofstream&& log_stream) :
      log_stream(std::move(log_stream))
{
}

print_stream_t::~print_stream_t(void)
{
   if(log_stream.is_open())
      log_stream.flush();
}

size_t print_stream_t::get_error_count(void) const
{
   return error_count.load();
}

void print_stream_t::print(std::basic_ostream<char>& stream, const char* prefix, const FMTNS::string_view& fmt, FMTNS::format_args args)
{
   std::unique_lock lock(print_mtx);

   FMTNS::vformat_to(std::ostreambuf_iterator<char>(stream), fmt, args);
   stream.put('\n');

   if(log_stream.is_open()) {
      char tstamp[32];
      time_t now = time(nullptr);
      strftime(tstamp, sizeof(tstamp), "%Y-%m-%d %H:%M:%S", localtime(&now));

      // 2026-10-19 12:34:56 [inf] message
      log_stream.write(tstamp, 19);
      log_stream.write(" [", 2);
      log_stream.write(prefix, 3);
      log_stream.write("] ", 2);

      FMTNS::vformat_to(std::ostreambuf_iterator<char>(log_stream), fmt, args);
      log_stream.put('\n');
   }

   lock.unlock();

   // flush on whichever thread gets the lock, so the log can be tailed while an import is running
   if(log_stream.is_open() && lock.try_lock())
      log_stream.flush();
}

}
