#include "modeltype.h"

QString modelTypeName(ModelType type)
{
    switch (type) {
    case ModelType::Alignment:
        return QStringLiteral("Alignment");
    case ModelType::Preview:
        return QStringLiteral("Preview Model");
    case ModelType::Normal:
        return QStringLiteral("Normal Model");
    case ModelType::Colorized:
        return QStringLiteral("Colorized Texture");
    }
    return QString();
}

std::optional<ModelType> modelTypeFromString(const QString &text)
{
    const QString key = text.trimmed().toLower();
    for (ModelType type : allModelTypes()) {
        if (key == modelTypeName(type).toLower()) {
            return type;
        }
    }

    if (key == QLatin1String("alignment") || key == QLatin1String("align")) {
        return ModelType::Alignment;
    }
    if (key == QLatin1String("preview")) {
        return ModelType::Preview;
    }
    if (key == QLatin1String("normal")) {
        return ModelType::Normal;
    }
    if (key == QLatin1String("colorized") || key == QLatin1String("texture")) {
        return ModelType::Colorized;
    }
    return std::nullopt;
}

const QList<ModelType> &allModelTypes()
{
    static const QList<ModelType> types = {
        ModelType::Alignment, ModelType::Preview, ModelType::Normal, ModelType::Colorized
    };
    return types;
}

QString templateExportTypeName(TemplateExportType type)
{
    switch (type) {
    case TemplateExportType::ProjectInfo:
        return QStringLiteral("Project Information");
    case TemplateExportType::PointCloud:
        return QStringLiteral("Point Cloud");
    case TemplateExportType::AlignCameras:
        return QStringLiteral("Alignment Cameras");
    }
    return QString();
}
