#ifndef SDIMPORT_OPERATOR_PROMPT_H
#define SDIMPORT_OPERATOR_PROMPT_H

#include <string>
#include <istream>
#include <ostream>

namespace sdimport {

//
// Asks the operator whether an import should continue after a failure.
//
class operator_prompt_t {
   public:
      virtual ~operator_prompt_t(void) = default;

      virtual bool ask_continue(const std::string& question) = 0;
};

//
// Prompts on the console until a `y` or `n` answer is entered. The end
// of input is taken as `n`.
//
class console_prompt_t : public operator_prompt_t {
   private:
      std::istream& input;
      std::ostream& output;

   public:
      console_prompt_t(std::istream& input, std::ostream& output);

      bool ask_continue(const std::string& question) override;
};

//
// Answers every question the same way, for unattended imports.
//
class auto_prompt_t : public operator_prompt_t {
   private:
      bool answer;

   public:
      auto_prompt_t(bool answer);

      bool ask_continue(const std::string& question) override;
};

}

#endif // SDIMPORT_OPERATOR_PROMPT_H
