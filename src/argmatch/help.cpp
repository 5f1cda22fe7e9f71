#include "./help.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

// Needed to determine terminal width
#include <sys/ioctl.h>
#include <unistd.h>

namespace argmatch {

using util::join;
using util::replace_all;

namespace {

char const help_flag_help[] = "show this help message and exit";
char const help_subcommand_help[] = "show this message or the help of the given subcommand(s)";

vector<string> wordwrap_paragraph(string_view input, size_t width) {
  vector<string> output;

  while (!input.empty()) {
    if (input[0] == ' ') {
      input.remove_prefix(1);
      continue;
    }

    if (input.size() < width) {
      output.push_back(string(input));
      break;
    }

    // Break at the last space within width+1 characters, or else at the first space after that
    auto line = input.substr(0, width + 1);
    size_t space_pos = line.rfind(' ');
    if (space_pos == string_view::npos)
      space_pos = input.find(' ', width + 1);
    line = input.substr(0, space_pos);

    output.push_back(string(line));
    input.remove_prefix(line.size());
  }

  return output;
}

/**
 * \brief Name chain of \p spec, with the name of the root level replaced by \p root_prog if it is non-empty
 **/
string resolve_prog(SpecModel const &spec, string const &root_prog) {
  auto parent = spec.parent();
  if (!parent)
    return root_prog.empty() ? spec.name() : root_prog;
  auto prefix = resolve_prog(parent, root_prog);
  if (prefix.empty())
    return spec.name();
  return prefix + " " + spec.name();
}

HelpFormatterParameters resolve_params(SpecModel const &spec, HelpFormatterParameters params) {
  params.prog = resolve_prog(spec, params.prog);
  return params;
}

/**
 * \brief Formats the placeholders for the values consumed by a single occurrence of \p arg
 **/
string format_args(ArgumentSpec const &arg) {
  auto metavar = arg.format_metavar();
  auto const &nargs = arg.nargs;

  if (nargs.is_unbounded() && nargs.min == 0)
    return "[" + metavar + " [" + metavar + " ...]]";

  vector<string> parts(nargs.min, metavar);
  if (nargs.is_unbounded()) {
    parts.push_back("[" + metavar + " ...]");
  } else {
    for (size_t i = nargs.min; i < nargs.max; ++i)
      parts.push_back("[" + metavar + "]");
  }
  return join(" ", parts);
}

vector<string> option_strings(ArgumentSpec const &arg) {
  vector<string> result;
  if (arg.short_name)
    result.push_back(string("-") + *arg.short_name);
  if (arg.long_name)
    result.push_back("--" + *arg.long_name);
  return result;
}

vector<string> help_option_strings(SpecModel const &spec) {
  vector<string> result;
  if (spec.help_short_enabled())
    result.push_back("-h");
  if (spec.help_long_enabled())
    result.push_back("--help");
  return result;
}

string format_help_text(ArgumentSpec const &arg) {
  string text = arg.help;
  auto append = [&](string const &s) {
    if (!text.empty())
      text += ' ';
    text += s;
  };
  if (arg.default_value)
    append("[default: " + *arg.default_value + "]");
  if (!arg.possible_values.empty())
    append("[possible values: " + join(", ", arg.possible_values) + "]");
  return text;
}

class HelpFormatter : public HelpFormatterParameters {
public:

  std::regex whitespace_matcher { R"RE(\s+)RE" };
  vector<string> wordwrap(string const &input, size_t width) {
    string text = std::regex_replace(input, whitespace_matcher, " ");
    string_view text_view = text;

    // strip whitespace at beginning and end
    while (!text_view.empty() && text_view[0] == ' ')
      text_view.remove_prefix(1);
    while (!text_view.empty() && text_view[text_view.size() - 1] == ' ')
      text_view.remove_suffix(1);
    return wordwrap_paragraph(text_view, width);
  }

  int current_indent = 0;
  int invocation_max_length = 0;
  std::ostringstream os;

  string trim() const {
    std::regex long_break_matcher("\n\n\n+");
    auto s = std::regex_replace(os.str(), long_break_matcher, "\n\n");
    string_view sv = s;
    auto pos = sv.find_first_not_of("\n");
    if (pos == string_view::npos)
      return {};
    sv = sv.substr(pos);
    sv = sv.substr(0, sv.find_last_not_of("\n") + 1);
    string result(sv);
    if (!result.empty())
      result += '\n';
    return result;
  }

  struct Section : public std::ostringstream {
    HelpFormatter &formatter;
    // Output stream to write output to in destructor
    std::ostream &os;

    string heading;

    Section(HelpFormatter &formatter, std::ostream &os, string heading)
      : formatter(formatter), os(os), heading(std::move(heading))
    {
      formatter.indent();
    }

    ~Section() {
      formatter.dedent();
      string contents = str();
      if (contents.empty())
        return;
      os << '\n';
      if (!heading.empty()) {
        formatter.spaces(os);
        os << heading << ":\n";
      }
      os << contents << '\n';
    }
  };

  explicit HelpFormatter(HelpFormatterParameters p)
    : HelpFormatterParameters(std::move(p))
  {
    if (width == 0) {
      struct ::winsize w;
      if (::ioctl(0, TIOCGWINSZ, &w) != -1 && w.ws_col > 0)
        width = int(w.ws_col);
      else
        width = 80;
      width -= 2;
    }
    max_help_position = std::min(max_help_position, std::max(width - 20, indent_increment * 2));
  }

  void indent() {
    current_indent += indent_increment;
  }

  void dedent() {
    current_indent = std::max(current_indent - indent_increment, 0);
  }

  static void spaces(std::ostream &os, int n) {
    for (int i = 0; i < n; ++i)
      os << ' ';
  }

  void spaces(std::ostream &os) {
    spaces(os, current_indent);
  }

  size_t get_text_width() const {
    return size_t(std::max(width - current_indent, min_text_width));
  }

  void print_text(std::ostream &os, string const &text_in) {
    if (text_in.empty())
      return;
    auto text = replace_all(text_in, "%(prog)s", prog);
    for (auto const &line : wordwrap(text, get_text_width())) {
      spaces(os);
      os << line << '\n';
    }
    os << '\n';
  }

  /**
   * \brief Formats an invocation such as \p "-c, --config FILE" for the argument list
   **/
  static string format_invocation(ArgumentSpec const &arg) {
    if (arg.is_positional())
      return arg.format_metavar();

    auto strings = option_strings(arg);
    if (!arg.takes_value())
      return join(", ", strings);
    string f = format_args(arg);
    return join(", ", strings, [&](string const &s) { return s + " " + f; });
  }

  void update_invocation_max_length(string const &invocation) {
    // entries are always indented by 1 level
    invocation_max_length = std::max(invocation_max_length, int(invocation.size()) + indent_increment);
  }

  /**
   * \brief Usage parts of the visible flags and options, the automatic help flag first
   **/
  static vector<string> format_options_usage(SpecModel const &spec) {
    vector<string> result;
    auto help_strings = help_option_strings(spec);
    if (!help_strings.empty())
      result.push_back('[' + help_strings.front() + ']');

    for (auto const &a : spec.arguments()) {
      if (a.hidden || a.is_positional())
        continue;
      string x = option_strings(a).front();
      if (a.takes_value()) {
        x += ' ';
        x += format_args(a);
      }
      if (!a.required)
        x = '[' + x + ']';
      result.push_back(std::move(x));
    }
    return result;
  }

  static vector<string> format_positionals_usage(SpecModel const &spec) {
    vector<string> result;
    for (auto a : spec.positionals()) {
      if (a->hidden)
        continue;
      string x = format_args(*a);
      if (!a->required && x[0] != '[')
        x = '[' + x + ']';
      result.push_back(std::move(x));
    }
    if (!spec.subcommands().empty())
      result.push_back(spec.settings().subcommand_required ? "<SUBCOMMAND> ..." : "[<SUBCOMMAND> ...]");
    return result;
  }

  void print_usage(std::ostream &os, SpecModel const &spec) {
    string prefix = "usage: ";
    string usage;

    if (auto const &usage_str = spec.usage()) {
      // suppressed
      if (usage_str->empty())
        return;
      usage = prefix + replace_all(*usage_str, "%(prog)s", prog);
    } else {
      auto opt_usage = format_options_usage(spec);
      auto pos_usage = format_positionals_usage(spec);

      vector<string> all_usage = opt_usage;
      all_usage.insert(all_usage.end(), pos_usage.begin(), pos_usage.end());

      // First try to format as a single line
      usage = prefix + prog;
      string action_usage = join(" ", all_usage);
      if (!prog.empty() && !action_usage.empty())
        usage += ' ';
      usage += action_usage;

      auto text_width = get_text_width();

      if (usage.size() > text_width) {
        // Too long to fit on one line
        usage = prefix;

        bool short_prog = false;

        // If prog is short, follow it with options and positionals, and indent to end of prog.
        if (double(usage.size() + prog.size()) <= 0.75 * double(text_width)) {
          usage += prog;
          if (!prog.empty())
            usage += ' ';
          short_prog = true;
        }
        // Otherwise, put prog on its own line and indent up to prefix

        string indent_str(usage.size(), ' ');
        size_t last_break = 0;
        bool break_next = false;

        auto write_part = [&](string const &part) {
          size_t line_len = usage.size() - last_break;
          bool first_part = (line_len == indent_str.size());

          if (break_next || (!first_part && part.size() + 1 + line_len > text_width)) {
            usage += '\n';
            last_break = usage.size();
            usage += indent_str;
            break_next = false;
            first_part = true;
          }
          if (!first_part)
            usage += ' ';
          usage += part;
        };

        if (!short_prog) {
          write_part(prog);
          break_next = true;
        }

        if (!short_prog && (action_usage.size() + indent_str.size() < text_width)) {
          write_part(action_usage);
        } else {
          for (auto const &p : opt_usage)
            write_part(p);
          if (!opt_usage.empty())
            break_next = true;
          for (auto const &p : pos_usage)
            write_part(p);
        }
      }
    }
    usage += '\n';
    os << usage << '\n';
  }

  void print_entry(std::ostream &os, string const &invocation, string const &help) {
    // +2 spaces of padding at end of invocation before help text
    int help_position = std::min(invocation_max_length + 2, max_help_position);

    int help_width = std::max(width - help_position, min_text_width);
    int invocation_width = help_position - current_indent - 2;

    spaces(os);
    os << invocation;

    if (help.empty()) {
      os << '\n';
      return;
    }

    bool is_first = true;
    if (invocation.size() > size_t(invocation_width)) {
      // long invocation, start help on the next line
      os << '\n';
      is_first = false;
    } else {
      // short invocation, just line up to help position
      spaces(os, help_position - current_indent - int(invocation.size()));
    }
    for (auto const &line : wordwrap(help, size_t(help_width))) {
      if (!is_first)
        spaces(os, help_position);
      is_first = false;
      os << line << '\n';
    }
  }
};

} // namespace

string format_subcommand_invocation(SpecModel const &sub) {
  if (sub.aliases().empty())
    return sub.name();
  return sub.name() + " (" + join(", ", sub.aliases()) + ")";
}

string SpecModel::help_string(HelpFormatterParameters const &params) const {
  HelpFormatter formatter(resolve_params(*this, params));

  vector<ArgumentSpec const *> options, flags;
  for (auto const &a : arguments()) {
    if (a.hidden || a.is_positional())
      continue;
    (a.takes_value() ? options : flags).push_back(&a);
  }

  auto help_strings = help_option_strings(*this);
  string help_invocation = join(", ", help_strings);

  for (auto const &a : arguments()) {
    if (!a.hidden)
      formatter.update_invocation_max_length(HelpFormatter::format_invocation(a));
  }
  if (!help_strings.empty())
    formatter.update_invocation_max_length(help_invocation);
  for (auto const &sub : subcommands())
    formatter.update_invocation_max_length(format_subcommand_invocation(sub));
  if (help_subcommand_enabled())
    formatter.update_invocation_max_length("help");

  formatter.print_usage(formatter.os, *this);

  formatter.print_text(formatter.os, description());

  {
    HelpFormatter::Section section(formatter, formatter.os, "positional arguments");
    for (auto a : positionals()) {
      if (!a->hidden)
        formatter.print_entry(section, HelpFormatter::format_invocation(*a), format_help_text(*a));
    }
  }

  {
    HelpFormatter::Section section(formatter, formatter.os, "options");
    for (auto a : options)
      formatter.print_entry(section, HelpFormatter::format_invocation(*a), format_help_text(*a));
  }

  {
    HelpFormatter::Section section(formatter, formatter.os, "flags");
    if (!help_strings.empty())
      formatter.print_entry(section, help_invocation, help_flag_help);
    for (auto a : flags)
      formatter.print_entry(section, HelpFormatter::format_invocation(*a), format_help_text(*a));
  }

  {
    HelpFormatter::Section section(formatter, formatter.os, "subcommands");
    for (auto const &sub : subcommands())
      formatter.print_entry(section, format_subcommand_invocation(sub), sub.description());
    if (help_subcommand_enabled())
      formatter.print_entry(section, "help", help_subcommand_help);
  }

  formatter.print_text(formatter.os, epilog());

  return formatter.trim();
}

string SpecModel::usage_string(HelpFormatterParameters const &params) const {
  HelpFormatter formatter(resolve_params(*this, params));
  formatter.print_usage(formatter.os, *this);
  return formatter.trim();
}

string error_string(ParseError const &error, HelpFormatterParameters const &params) {
  auto const &spec = error.spec();
  return spec.usage_string(params) + resolve_prog(spec, params.prog) + ": error: " + error.what() + "\n";
}

} // namespace argmatch
