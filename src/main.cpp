#include <QCoreApplication>
#include <QTextStream>

#include "cli/cli.h"
#include "fieldfu_config.h"

namespace {
void set_app_metadata(QCoreApplication& app) {
  app.setApplicationName("FieldFu");
  app.setOrganizationName("FieldFu");
  app.setApplicationVersion(FIELDFU_VERSION);
}
}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  set_app_metadata(app);

  CliOptions options;
  QString output;
  const CliParseResult result = parse_cli(app, options, &output);
  if (result != CliParseResult::Ok) {
    if (!output.isEmpty()) {
      QTextStream(result == CliParseResult::ExitError ? stderr : stdout) << output;
    }
    return cli_parse_exit_code(result);
  }

  return run_cli(options);
}
