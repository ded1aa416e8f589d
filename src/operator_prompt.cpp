#include "operator_prompt.h"

#include <cctype>

namespace sdimport {

console_prompt_t::console_prompt_t(std::istream& input, std::ostream& output) :
      input(input),
      output(output)
{
}

bool console_prompt_t::ask_continue(const std::string& question)
{
   std::string answer;

   while(true) {
      output << question << " Continue? [y/n] " << std::flush;

      if(!std::getline(input, answer))
         return false;

      if(!answer.empty()) {
         char first = static_cast<char>(std::tolower(static_cast<unsigned char>(answer.front())));

         if(first == 'y')
            return true;

         if(first == 'n')
            return false;
      }
   }
}

auto_prompt_t::auto_prompt_t(bool answer) :
      answer(answer)
{
}

bool auto_prompt_t::ask_continue(const std::string& question)
{
   return answer;
}

}
