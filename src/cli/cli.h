#pragma once

#include <QString>

class QCoreApplication;

struct CliOptions {
  bool info = false;
  bool resolve = false;
  bool save_preferences = false;
  int palette = -1;  // -1: use the saved preference.
  int frame = -1;
  QString export_png_path;
  QString reencode_path;
  QString search_dir;
  QString file_path;
};

// Persisted with QSettings; applied when the matching option is not given.
struct CliPreferences {
  int palette = 0;
  QString search_dir;
};

// Process exit codes. Missing linked resources are a partial result, not an error.
enum CliExitCode {
  kCliExitOk = 0,
  kCliExitMissingResources = 1,
  kCliExitError = 2,
};

enum class CliParseResult {
  Ok,
  ExitOk,
  ExitError,
};

[[nodiscard]] CliPreferences load_cli_preferences();
void save_cli_preferences(const CliPreferences& prefs);

// Exit code for a parse that does not continue into run_cli.
[[nodiscard]] int cli_parse_exit_code(CliParseResult result);

CliParseResult parse_cli(QCoreApplication& app, CliOptions& options, QString* output);
int run_cli(const CliOptions& options);
