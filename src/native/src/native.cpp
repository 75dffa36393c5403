#include "native.h"

#include <array>
#include <clocale>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include <sys/wait.h>

namespace chainsink::native
{
    namespace
    {
        std::string _shellQuote(const std::string & value)
        {
            std::string quoted = "'";
            for(const char c : value)
            {
                if(c == '\'')
                {
                    quoted += "'\\''";
                }
                else
                {
                    quoted += c;
                }
            }
            quoted += "'";
            return quoted;
        }
    }

    bool configureTerminal()
    {
        return std::setlocale(LC_ALL, "") != nullptr;
    }

    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args)
    {
        std::string line = _shellQuote(command);
        for(const std::string & arg : args)
        {
            line += ' ';
            line += _shellQuote(arg);
        }
        line += " 2>&1";

        FILE * pipe = popen(line.c_str(), "r");
        if(pipe == nullptr)
        {
            throw std::runtime_error("popen() failed for " + command);
        }

        std::string output;
        std::array<char, 4096> buffer;
        std::size_t read = 0;
        while((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0)
        {
            output.append(buffer.data(), read);
        }

        const int status = pclose(pipe);
        if(status == -1)
        {
            throw std::runtime_error("pclose() failed for " + command);
        }

        const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return {exit_code, std::move(output)};
    }
}
