#include "formats/field_model_assets.h"

#include <QDebug>
#include <QSet>
#include <QtGlobal>

int FieldModelAssets::resolved_resource_count() const {
  int count = 0;
  for (const LinkedBone& bone : bones) {
    for (const LinkedResource& res : bone.resources) {
      if (res.found) {
        ++count;
      }
    }
  }
  return count;
}

FieldModelAssets resolve_field_model_assets(const HrcSkeleton& skeleton,
                                            const FieldAssetResolver& resolver,
                                            const FieldModelAssetOptions& options) {
  FieldModelAssets out;
  if (!resolver) {
    out.log << "No resolver supplied; linked resources left unresolved.";
  }

  QSet<QString> attempted_textures;
  out.bones.reserve(skeleton.bones.size());
  for (int i = 0; i < skeleton.bones.size(); ++i) {
    const HrcBone& bone = skeleton.bones[i];
    LinkedBone linked;
    linked.bone_index = i;
    linked.bone_name = bone.name;
    linked.parent_index = hrc_bone_parent_index(skeleton, i);

    for (const QString& rsd_name : bone.resources) {
      LinkedResource res;
      res.rsd_name = rsd_name;
      res.rsd_file = rsd_name + ".rsd";

      const std::optional<QByteArray> rsd_bytes = resolver ? resolver(res.rsd_file) : std::nullopt;
      if (!rsd_bytes) {
        out.missing << res.rsd_file;
        if (resolver) {
          qWarning() << "FieldModelAssets: missing resource" << res.rsd_file << "for bone" << bone.name;
          out.log << QString("Bone %1: %2 not found.").arg(bone.name, res.rsd_file);
        }
        linked.resources.push_back(res);
        continue;
      }

      res.found = true;
      res.rsd = parse_rsd_bytes(*rsd_bytes);
      res.p_model = rsd_p_model_filename(res.rsd);
      res.textures = rsd_texture_filenames(res.rsd);
      out.log << QString("Bone %1: %2 -> %3 (%4 textures).")
                   .arg(bone.name, res.rsd_file, res.p_model.isEmpty() ? QString("<no model>") : res.p_model)
                   .arg(res.textures.size());

      if (options.decode_textures) {
        for (const QString& tex_name : res.textures) {
          if (attempted_textures.contains(tex_name)) {
            continue;
          }
          attempted_textures.insert(tex_name);

          const std::optional<QByteArray> tex_bytes = resolver(tex_name);
          if (!tex_bytes) {
            out.missing << tex_name;
            qWarning() << "FieldModelAssets: missing texture" << tex_name << "referenced by" << res.rsd_file;
            out.log << QString("%1: texture %2 not found.").arg(res.rsd_file, tex_name);
            continue;
          }

          FormatError err;
          std::optional<TexImage> tex = parse_tex_image(*tex_bytes, &err);
          if (!tex) {
            qWarning() << "FieldModelAssets: unable to decode" << tex_name << "-" << describe_format_error(err);
            out.log << QString("%1: %2").arg(tex_name, describe_format_error(err));
            continue;
          }
          out.textures.insert(tex_name, std::move(*tex));
        }
      }

      linked.resources.push_back(std::move(res));
    }

    out.bones.push_back(std::move(linked));
  }

  return out;
}
