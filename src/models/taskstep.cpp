#include "taskstep.h"

namespace {

TaskStep makeStep(TaskStep::Kind kind, ModelType model)
{
    TaskStep step;
    step.kind = kind;
    step.model = model;
    return step;
}

QString kindName(TaskStep::Kind kind)
{
    switch (kind) {
    case TaskStep::Kind::ProjectStatus:
        return QStringLiteral("ProjectStatus");
    case TaskStep::Kind::CalculateModel:
        return QStringLiteral("CalculateModel");
    case TaskStep::Kind::SelectTriangles:
        return QStringLiteral("SelectTriangles");
    case TaskStep::Kind::ComputeModel:
        return QStringLiteral("ComputeModel");
    case TaskStep::Kind::SimplifyAndExport:
        return QStringLiteral("SimplifyAndExport");
    case TaskStep::Kind::ExportSelected:
        return QStringLiteral("ExportSelected");
    case TaskStep::Kind::DownloadModel:
        return QStringLiteral("DownloadModel");
    case TaskStep::Kind::DownloadTemplateExport:
        return QStringLiteral("DownloadTemplateExport");
    }
    return QStringLiteral("Unknown");
}

} // namespace

TaskStep TaskStep::projectStatus()
{
    return makeStep(Kind::ProjectStatus, ModelType::Alignment);
}

TaskStep TaskStep::calculateModel(ModelType model)
{
    return makeStep(Kind::CalculateModel, model);
}

TaskStep TaskStep::selectTriangles(ModelType model)
{
    return makeStep(Kind::SelectTriangles, model);
}

TaskStep TaskStep::computeModel(ModelType model)
{
    return makeStep(Kind::ComputeModel, model);
}

TaskStep TaskStep::simplifyAndExport(ModelType model)
{
    return makeStep(Kind::SimplifyAndExport, model);
}

TaskStep TaskStep::exportSelected(ModelType model)
{
    return makeStep(Kind::ExportSelected, model);
}

TaskStep TaskStep::downloadModel(ModelType model)
{
    return makeStep(Kind::DownloadModel, model);
}

TaskStep TaskStep::downloadTemplateExport(const QString &file, TemplateExportType type)
{
    TaskStep step = makeStep(Kind::DownloadTemplateExport, ModelType::Alignment);
    step.file = file;
    step.exportType = type;
    return step;
}

QString TaskStep::describe() const
{
    switch (kind) {
    case Kind::ProjectStatus:
        return kindName(kind);
    case Kind::DownloadTemplateExport:
        return QString("%1(%2, %3)").arg(kindName(kind), file, templateExportTypeName(exportType));
    default:
        return QString("%1(%2)").arg(kindName(kind), modelTypeName(model));
    }
}

bool TaskStep::operator==(const TaskStep &other) const
{
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
    case Kind::ProjectStatus:
        return true;
    case Kind::DownloadTemplateExport:
        return file == other.file && exportType == other.exportType;
    default:
        return model == other.model;
    }
}
