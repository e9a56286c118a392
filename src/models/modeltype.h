/**
 * @file modeltype.h
 * @brief Kinds of 3D output the reconstruction node can produce.
 */

#ifndef MODELTYPE_H
#define MODELTYPE_H

#include <QList>
#include <QString>

#include <optional>

enum class ModelType {
    Alignment,   ///< Sparse alignment only; nothing to download
    Preview,
    Normal,
    Colorized
};

/**
 * @brief Kinds of report exported through an uploaded template.
 */
enum class TemplateExportType {
    ProjectInfo,
    PointCloud,
    AlignCameras
};

/**
 * @brief Display and file name of a model ("Preview Model", ...).
 *
 * The node exports a model as "<name>.zip" and it is unpacked locally into
 * a directory of the same name.
 */
[[nodiscard]] QString modelTypeName(ModelType type);

/**
 * @brief Parses a model name or a short key ("preview", "normal", ...).
 */
[[nodiscard]] std::optional<ModelType> modelTypeFromString(const QString &text);

[[nodiscard]] const QList<ModelType> &allModelTypes();

[[nodiscard]] QString templateExportTypeName(TemplateExportType type);

#endif // MODELTYPE_H
