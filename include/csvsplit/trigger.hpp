#ifndef CSVSPLIT_TRIGGER_HPP
#define CSVSPLIT_TRIGGER_HPP

#include <cstddef>
#include <string>

namespace csvsplit {

/**
 * Shell command run after each output file is finished.
 *
 * Placeholders in the template:
 *   {}      absolute path of the finished file
 *   {/}     file name without directories
 *   {rows}  number of data rows in the file
 *
 * The command runs through `sh -c`. A failing command is reported as a
 * warning and never stops the split.
 */
class Trigger {
public:
    explicit Trigger(std::string command_template);

    /**
     * Substitute the placeholders of command_template.
     */
    static std::string format(const std::string& command_template,
                              const std::string& path, size_t rows);

    std::string command_for(const std::string& path, size_t rows) const {
        return format(template_, path, rows);
    }

    /**
     * Run the command for a finished file and wait for it.
     *
     * @return Exit status of the shell, or -1 if it could not be run
     *         or was killed by a signal
     */
    int run(const std::string& path, size_t rows) const;

    const std::string& command_template() const { return template_; }

private:
    std::string template_;
};

}  // namespace csvsplit

#endif  // CSVSPLIT_TRIGGER_HPP
