#include "cli.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QSaveFile>
#include <QSettings>
#include <QTextStream>

#include "cli/dir_asset_resolver.h"
#include "formats/field_animation.h"
#include "formats/field_asset_kind.h"
#include "formats/field_asset_loader.h"
#include "formats/field_model_assets.h"
#include "formats/hrc_skeleton.h"
#include "formats/tex_image.h"

namespace {
constexpr char kPaletteKey[] = "cli/paletteSelector";
constexpr char kSearchDirKey[] = "cli/searchDir";

QString normalize_output(const QString& text) {
  return text.endsWith('\n') ? text : text + '\n';
}

bool parse_int_option(const QCommandLineParser& parser,
                      const QCommandLineOption& option,
                      int* out,
                      QString* error) {
  if (!parser.isSet(option)) {
    return true;
  }
  bool ok = false;
  const int v = parser.value(option).toInt(&ok);
  if (!ok || v < 0) {
    if (error) {
      *error = QString("Invalid value for --%1: %2").arg(option.names().constLast(), parser.value(option));
    }
    return false;
  }
  *out = v;
  return true;
}

bool read_file_bytes(const QString& path, QByteArray* out, QString* error) {
  QFile f(path);
  if (!f.open(QIODevice::ReadOnly)) {
    if (error) {
      *error = "Unable to open file: " + f.errorString();
    }
    return false;
  }
  *out = f.readAll();
  return true;
}

bool write_file_bytes(const QString& path, const QByteArray& bytes, QString* error) {
  QSaveFile f(path);
  if (!f.open(QIODevice::WriteOnly)) {
    if (error) {
      *error = "Unable to open output file: " + f.errorString();
    }
    return false;
  }
  if (f.write(bytes) != bytes.size() || !f.commit()) {
    if (error) {
      *error = "Unable to write output file: " + f.errorString();
    }
    return false;
  }
  return true;
}

int run_texture_actions(const CliOptions& options, const QByteArray& bytes, int palette, QTextStream& out, QTextStream& err) {
  FormatError parse_err;
  const std::optional<TexImage> tex = parse_tex_image(bytes, &parse_err);
  if (!tex) {
    err << describe_format_error(parse_err) << "\n";
    return kCliExitError;
  }

  if (!options.export_png_path.isEmpty()) {
    const QImage image = tex_image_to_qimage(*tex, palette);
    if (image.isNull() || !image.save(options.export_png_path, "PNG")) {
      err << "Unable to write PNG: " << options.export_png_path << "\n";
      return kCliExitError;
    }
    qInfo() << "Cli: exported" << options.file_path << "palette" << palette << "to" << options.export_png_path;
    out << "Exported: " << QFileInfo(options.export_png_path).absoluteFilePath() << "\n";
  }

  if (!options.reencode_path.isEmpty()) {
    if (tex->header.variant == TexHeaderVariant::Alternative) {
      qWarning() << "Cli: alternative header layout will be written in the standard layout";
    }
    FormatError encode_err;
    const QByteArray encoded = encode_tex_image(*tex, &encode_err);
    if (encoded.isEmpty()) {
      err << describe_format_error(encode_err) << "\n";
      return kCliExitError;
    }
    QString write_err;
    if (!write_file_bytes(options.reencode_path, encoded, &write_err)) {
      err << write_err << "\n";
      return kCliExitError;
    }
    out << "Re-encoded: " << QFileInfo(options.reencode_path).absoluteFilePath() << " (" << encoded.size()
        << " bytes, " << (encoded == bytes ? "identical" : "differs from input") << ")\n";
  }
  return kCliExitOk;
}

int run_animation_frame(const QByteArray& bytes, int frame_index, QTextStream& out, QTextStream& err) {
  FormatError parse_err;
  const std::optional<FieldAnimation> anim = parse_field_animation(bytes, &parse_err);
  if (!anim) {
    err << describe_format_error(parse_err) << "\n";
    return kCliExitError;
  }
  const FieldFrame* frame = field_animation_frame(*anim, frame_index);
  if (!frame) {
    err << "Frame " << frame_index << " not found (" << anim->frames.size() << " frames).\n";
    return kCliExitError;
  }
  out << "Frame " << frame_index << ":\n";
  out << "  root rotation: " << frame->root_rotation.alpha << " " << frame->root_rotation.beta << " "
      << frame->root_rotation.gamma << "\n";
  out << "  root translation: " << frame->root_translation.x() << " " << frame->root_translation.y() << " "
      << frame->root_translation.z() << "\n";
  for (int i = 0; i < frame->bone_rotations.size(); ++i) {
    const FieldRotation& r = frame->bone_rotations[i];
    out << "  bone " << i << ": " << r.alpha << " " << r.beta << " " << r.gamma << "\n";
  }
  return kCliExitOk;
}

int run_resolve(const QByteArray& bytes, const QString& search_dir, QTextStream& out, QTextStream& err) {
  FormatError parse_err;
  const std::optional<HrcSkeleton> hrc = parse_hrc_bytes(bytes, &parse_err);
  if (!hrc) {
    err << describe_format_error(parse_err) << "\n";
    return kCliExitError;
  }

  qInfo() << "Cli: resolving linked resources in" << search_dir;
  const FieldModelAssets assets = resolve_field_model_assets(*hrc, make_dir_asset_resolver(search_dir));
  for (const LinkedBone& bone : assets.bones) {
    out << "[" << bone.bone_index << "] " << bone.bone_name << " (parent " << bone.parent_index << ")\n";
    for (const LinkedResource& res : bone.resources) {
      if (!res.found) {
        out << "  " << res.rsd_file << ": missing\n";
        continue;
      }
      out << "  " << res.rsd_file << ": " << (res.p_model.isEmpty() ? QString("<no model>") : res.p_model);
      for (const QString& tex : res.textures) {
        const auto it = assets.textures.constFind(tex);
        out << " " << tex;
        if (it != assets.textures.constEnd()) {
          out << "(" << it->header.width << "x" << it->header.height << ")";
        }
      }
      out << "\n";
    }
  }
  out << "Resolved resources: " << assets.resolved_resource_count() << "\n";
  out << "Decoded textures: " << assets.textures.size() << "\n";
  if (!assets.missing.isEmpty()) {
    out << "Missing: " << assets.missing.join(", ") << "\n";
  }
  return assets.missing.isEmpty() ? kCliExitOk : kCliExitMissingResources;
}
}  // namespace

CliPreferences load_cli_preferences() {
  QSettings settings;
  CliPreferences prefs;
  prefs.palette = qMax(0, settings.value(kPaletteKey, 0).toInt());
  prefs.search_dir = settings.value(kSearchDirKey).toString();
  return prefs;
}

void save_cli_preferences(const CliPreferences& prefs) {
  QSettings settings;
  settings.setValue(kPaletteKey, prefs.palette);
  if (prefs.search_dir.isEmpty()) {
    settings.remove(kSearchDirKey);
  } else {
    settings.setValue(kSearchDirKey, prefs.search_dir);
  }
}

int cli_parse_exit_code(CliParseResult result) {
  return result == CliParseResult::ExitError ? kCliExitError : kCliExitOk;
}

CliParseResult parse_cli(QCoreApplication& app, CliOptions& options, QString* output) {
  QCommandLineParser parser;
  parser.setApplicationDescription("FieldFu field asset inspector");
  parser.addHelpOption();
  parser.addVersionOption();

  const QCommandLineOption info_option({"i", "info"}, "Show a summary of the asset.");
  const QCommandLineOption export_option({"e", "export-png"}, "Export a TEX image as PNG.", "file");
  const QCommandLineOption reencode_option({"r", "reencode"}, "Re-encode a TEX image (standard header layout).", "file");
  const QCommandLineOption palette_option({"p", "palette"}, "Palette used for TEX expansion.", "index");
  const QCommandLineOption frame_option({"f", "frame"}, "Dump one frame of a field animation.", "index");
  const QCommandLineOption resolve_option("resolve", "Resolve an HRC skeleton's RSD and TEX files.");
  const QCommandLineOption search_dir_option(
    {"d", "search-dir"},
    "Directory holding linked RSD/TEX files (default: the skeleton's directory).",
    "dir");
  const QCommandLineOption save_prefs_option("save-preferences", "Remember --palette and --search-dir as defaults.");

  parser.addOption(info_option);
  parser.addOption(export_option);
  parser.addOption(reencode_option);
  parser.addOption(palette_option);
  parser.addOption(frame_option);
  parser.addOption(resolve_option);
  parser.addOption(search_dir_option);
  parser.addOption(save_prefs_option);
  parser.addPositionalArgument("file", "Path to a .tex, .rsd, .hrc or .a file.");

  if (!parser.parse(app.arguments())) {
    if (output) {
      *output = normalize_output(parser.errorText()) + '\n' + parser.helpText();
    }
    return CliParseResult::ExitError;
  }

  if (parser.isSet("help")) {
    if (output) {
      *output = parser.helpText();
    }
    return CliParseResult::ExitOk;
  }

  if (parser.isSet("version")) {
    if (output) {
      *output = normalize_output(app.applicationName() + ' ' + app.applicationVersion());
    }
    return CliParseResult::ExitOk;
  }

  QString int_err;
  if (!parse_int_option(parser, palette_option, &options.palette, &int_err) ||
      !parse_int_option(parser, frame_option, &options.frame, &int_err)) {
    if (output) {
      *output = normalize_output(int_err);
    }
    return CliParseResult::ExitError;
  }

  options.info = parser.isSet(info_option);
  options.resolve = parser.isSet(resolve_option);
  options.save_preferences = parser.isSet(save_prefs_option);
  options.export_png_path = parser.value(export_option);
  options.reencode_path = parser.value(reencode_option);
  options.search_dir = parser.value(search_dir_option);

  const QStringList positional = parser.positionalArguments();
  if (!positional.isEmpty()) {
    options.file_path = positional.first();
  }

  const bool any_action = options.info || options.resolve || options.frame >= 0 ||
                          !options.export_png_path.isEmpty() || !options.reencode_path.isEmpty();
  if (options.file_path.isEmpty() && !options.save_preferences) {
    if (output) {
      *output = any_action ? normalize_output("Missing file path.") + '\n' + parser.helpText() : parser.helpText();
    }
    return any_action ? CliParseResult::ExitError : CliParseResult::ExitOk;
  }

  if (!any_action && !options.file_path.isEmpty()) {
    options.info = true;
  }

  return CliParseResult::Ok;
}

int run_cli(const CliOptions& options) {
  QTextStream out(stdout);
  QTextStream err(stderr);

  CliPreferences prefs = load_cli_preferences();
  const int palette = options.palette >= 0 ? options.palette : prefs.palette;

  if (options.save_preferences) {
    if (options.palette >= 0) {
      prefs.palette = options.palette;
    }
    if (!options.search_dir.isEmpty()) {
      prefs.search_dir = QFileInfo(options.search_dir).absoluteFilePath();
    }
    save_cli_preferences(prefs);
    out << "Preferences saved (palette " << prefs.palette << ", search dir "
        << (prefs.search_dir.isEmpty() ? QString("<file directory>") : prefs.search_dir) << ").\n";
    if (options.file_path.isEmpty()) {
      return kCliExitOk;
    }
  }

  const QFileInfo info(options.file_path);
  if (!info.exists()) {
    err << "File not found: " << options.file_path << "\n";
    return kCliExitError;
  }

  QByteArray bytes;
  QString read_err;
  if (!read_file_bytes(info.absoluteFilePath(), &bytes, &read_err)) {
    err << read_err << "\n";
    return kCliExitError;
  }

  const FieldAssetKind kind = field_asset_kind_for_name(info.fileName());
  int rc = kCliExitOk;

  if (options.info) {
    const FieldAssetDecodeResult result = decode_field_asset_bytes(bytes, info.fileName(), palette);
    if (!result.ok()) {
      err << "Cannot preview " << info.fileName() << ": "
          << (result.error.isEmpty() ? QString("unknown error") : result.error) << "\n";
      rc = 2;
    } else {
      out << "File: " << info.absoluteFilePath() << "\n";
      out << result.summary;
    }
  }

  if (!options.export_png_path.isEmpty() || !options.reencode_path.isEmpty()) {
    if (kind != FieldAssetKind::Texture) {
      err << "--export-png and --reencode need a .tex file.\n";
      return kCliExitError;
    }
    rc = qMax(rc, run_texture_actions(options, bytes, palette, out, err));
  }

  if (options.frame >= 0) {
    if (kind != FieldAssetKind::Animation) {
      err << "--frame needs a field animation (.a) file.\n";
      return kCliExitError;
    }
    rc = qMax(rc, run_animation_frame(bytes, options.frame, out, err));
  }

  if (options.resolve) {
    if (kind != FieldAssetKind::Skeleton) {
      err << "--resolve needs an .hrc skeleton.\n";
      return kCliExitError;
    }
    QString search_dir = options.search_dir;
    if (search_dir.isEmpty()) {
      search_dir = prefs.search_dir.isEmpty() ? info.absolutePath() : prefs.search_dir;
    }
    rc = qMax(rc, run_resolve(bytes, search_dir, out, err));
  }

  return rc;
}
