#include "file_hasher.h"
#include "mb_sha256_traits.h"
#include "format.h"

#include "sdimport.h"

#include <memory>
#include <stdexcept>
#include <algorithm>
#include <iterator>

#include <cstring>
#include <cerrno>

using namespace std::literals::string_view_literals;

namespace sdimport {

namespace {

typedef mb_sha256_traits traits;

//
// Data members in the context manager must be aligned for SSE, AVX,
// AVX2 and AVX512 operations or the flush call will fault while
// accessing the lane lengths. 64 bytes is what AVX512 requires.
//
struct hash_ctx_mgr_t {
   alignas(file_hasher_t::ALIGN_MEM) traits::HASH_CTX_MGR mgr;
};

//
// A hash job slot, which is reused for the next file once the file
// it was hashing is complete. Slots are referred to from isa-l_crypto
// contexts via `user_data` and cannot be moved after they are set up.
//
struct hash_job_t {
   size_t file_index = 0;

   std::unique_ptr<FILE, file_handle_deleter_t> file;

   std::unique_ptr<unsigned char[]> buffer_storage;

   // memory aligned buffer pointer within buffer_storage
   unsigned char *buffer = nullptr;

   // set if a read failed and the digest must be discarded
   std::optional<std::string> read_error;

   traits::HASH_CTX ctx;

   hash_job_t(size_t buf_size);
};

hash_job_t::hash_job_t(size_t buf_size) :
      buffer_storage(new unsigned char[buf_size + file_hasher_t::ALIGN_MEM])
{
   void *aligned = buffer_storage.get();
   size_t buf_space = buf_size + file_hasher_t::ALIGN_MEM;

   if(std::align(file_hasher_t::ALIGN_MEM, buf_size, aligned, buf_space) == nullptr)
      throw std::runtime_error("Cannot align a memory buffer for hashing");

   buffer = static_cast<unsigned char*>(aligned);

   // sets ctx.status to ISAL_HASH_CTX_STS_COMPLETE, which is what a new job expects
   isal_hash_ctx_init(&ctx);

   ctx.user_data = this;
}

//
// Reads the next block for a job. Returns `false` when there is no
// more data, which includes read errors, which are recorded in the
// job instead of being thrown, because a submitted job must always be
// completed for the context manager to remain usable.
//
bool read_block(hash_job_t& job, size_t buf_size, size_t& data_size) noexcept
{
   data_size = fread(job.buffer, 1, buf_size, job.file.get());

   if(data_size < buf_size) {
      if(ferror(job.file.get()))
         job.read_error = std::strerror(errno);

      return false;
   }

   // peek at the next character to submit the last block with ISAL_HASH_LAST rather than an empty one
   int next = fgetc(job.file.get());

   if(next == EOF) {
      if(ferror(job.file.get()))
         job.read_error = std::strerror(errno);

      return false;
   }

   ungetc(next, job.file.get());

   return true;
}

std::string digest_to_hex(const uint32_t digest[traits::HASH_UINT32_SIZE])
{
   std::string hex;

   hex.reserve(traits::HASH_SIZE * 2);

   for(size_t i = 0; i < traits::HASH_UINT32_SIZE; i++) {
      if(traits::HASH_UINT32_REORDER)
         FMTNS::format_to(std::back_inserter(hex), "{:08x}"sv, digest[i]);
      else {
         const unsigned char *bytes = reinterpret_cast<const unsigned char*>(&digest[i]);

         for(size_t k = 0; k < sizeof(uint32_t); k++)
            FMTNS::format_to(std::back_inserter(hex), "{:02x}"sv, bytes[k]);
      }
   }

   return hex;
}

}

file_hasher_t::file_hasher_t(size_t buf_size, size_t max_jobs) :
      buf_size(buf_size),
      max_jobs(max_jobs)
{
   if(!buf_size)
      throw std::invalid_argument("Hash buffer size cannot be zero");

   if(!max_jobs)
      throw std::invalid_argument("Hash job count cannot be zero");
}

//
// Files are opened one at a time as job slots become available and
// the first block of each file is submitted as soon as it is opened.
// Contexts returned from submit or flush calls either need the next
// block, which is submitted right away, or are complete, which frees
// their slot for the next file.
//
std::vector<hash_result_t> file_hasher_t::hash_files(const std::vector<std::filesystem::path>& filepaths) const
{
   std::vector<hash_result_t> results(filepaths.size());

   if(filepaths.empty())
      return results;

   std::unique_ptr<hash_ctx_mgr_t> ctx_mgr = std::make_unique<hash_ctx_mgr_t>();

   int isal_error = ISAL_CRYPTO_ERR_NONE;

   if((isal_error = traits::ctx_mgr_init(&ctx_mgr->mgr)) != ISAL_CRYPTO_ERR_NONE)
      throw std::runtime_error(FMTNS::format("Cannot initialize a {:s} context manager ({:d})"sv, traits::HASH_TYPE, isal_error));

   // slots are never reallocated because contexts point to them
   std::vector<std::unique_ptr<hash_job_t>> jobs;
   std::vector<hash_job_t*> free_jobs;

   size_t next_file = 0;
   size_t active_jobs = 0;

   while(next_file < filepaths.size() || active_jobs) {
      traits::HASH_CTX *ctx = nullptr;

      if(next_file < filepaths.size() && (!free_jobs.empty() || jobs.size() < max_jobs)) {
         hash_job_t *job = nullptr;

         if(!free_jobs.empty()) {
            job = free_jobs.back();
            free_jobs.pop_back();
         }
         else
            job = jobs.emplace_back(std::make_unique<hash_job_t>(buf_size)).get();

         job->file_index = next_file++;
         job->read_error.reset();

         // open the file in binary mode, where supported, so no end-of-line translation is performed
         job->file.reset(fopen(filepaths[job->file_index].c_str(), "rb"));

         if(!job->file) {
            results[job->file_index].error = FMTNS::format("Cannot open {:s} ({:s})"sv, filepaths[job->file_index].u8string(), std::strerror(errno));
            free_jobs.push_back(job);
            continue;
         }

         size_t data_size = 0;
         bool moredata = read_block(*job, buf_size, data_size);

         //
         // Zero-length files are submitted as complete jobs, which
         // isa-l_crypto hashes as empty input.
         //
         if((isal_error = traits::ctx_mgr_submit(&ctx_mgr->mgr, &job->ctx, &ctx, job->buffer, static_cast<uint32_t>(data_size), moredata ? ISAL_HASH_FIRST : ISAL_HASH_ENTIRE)) != ISAL_CRYPTO_ERR_NONE)
            throw std::runtime_error(FMTNS::format("Cannot submit a hash job for {:s} ({:d})"sv, filepaths[job->file_index].u8string(), isal_error));

         active_jobs++;
      }
      else {
         if((isal_error = traits::ctx_mgr_flush(&ctx_mgr->mgr, &ctx)) != ISAL_CRYPTO_ERR_NONE)
            throw std::runtime_error(FMTNS::format("Cannot flush hash jobs ({:d})"sv, isal_error));

         if(!ctx)
            throw std::runtime_error("Got a null flushed context while processing hash jobs");
      }

      // keep feeding the returned context until it is complete or is being processed
      while(ctx) {
         hash_job_t *job = static_cast<hash_job_t*>(ctx->user_data);

         if(ctx->error != ISAL_HASH_CTX_ERROR_NONE)
            throw std::runtime_error(FMTNS::format("Got a context with an error ({:d}) for {:s}"sv, static_cast<int>(ctx->error), filepaths[job->file_index].u8string()));

         if(ctx->status == ISAL_HASH_CTX_STS_COMPLETE) {
            hash_result_t& result = results[job->file_index];

            if(job->read_error.has_value())
               result.error = FMTNS::format("Cannot read {:s} ({:s})"sv, filepaths[job->file_index].u8string(), job->read_error.value());
            else
               result.digest = digest_to_hex(ctx->job.result_digest);

            job->file.reset();
            free_jobs.push_back(job);
            active_jobs--;
            break;
         }

         size_t data_size = 0;
         bool moredata = read_block(*job, buf_size, data_size);

         if((isal_error = traits::ctx_mgr_submit(&ctx_mgr->mgr, ctx, &ctx, job->buffer, static_cast<uint32_t>(data_size), moredata ? ISAL_HASH_UPDATE : ISAL_HASH_LAST)) != ISAL_CRYPTO_ERR_NONE)
            throw std::runtime_error(FMTNS::format("Cannot submit a hash job for {:s} ({:d})"sv, filepaths[job->file_index].u8string(), isal_error));
      }
   }

   return results;
}

std::string file_hasher_t::hash_file(const std::filesystem::path& filepath) const
{
   std::vector<hash_result_t> results = hash_files({filepath});

   if(!results.front().digest.has_value())
      throw std::runtime_error(results.front().error);

   return std::move(results.front().digest.value());
}

}
