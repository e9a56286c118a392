/**
 * @file test_nodecontroller.cpp
 * @brief Unit tests for NodeController and the project commands it runs.
 *
 * Tests verify:
 * - Node discovery by probing candidate addresses
 * - Project status reconciliation on change counter updates
 * - Task table updates, follow-ups and remote task failures
 * - Open-project prerequisite injection and skipping
 * - Front-end project operations (create, delete)
 * - Command construction for task steps
 */

#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QStandardPaths>

#include "mocks/mockcommand.h"
#include "mocks/testnodeenvironment.h"
#include "services/commandqueuecontroller.h"
#include "services/httpconnection.h"
#include "services/modelcommands.h"
#include "services/nodecommands.h"
#include "services/nodecontroller.h"
#include "services/projectcommands.h"
#include "services/templatecommands.h"

namespace {

QByteArray taskReport(const QByteArray &taskId, const QByteArray &state, int errorCode = 0,
                      const QByteArray &errorMessage = QByteArray())
{
    return "{\"taskID\":\"" + taskId + "\",\"timeStart\":10,\"timeEnd\":20,\"state\":\"" + state
           + "\",\"errorCode\":" + QByteArray::number(errorCode) + ",\"errorMessage\":\""
           + errorMessage + "\"}";
}

WaitingTask waitingTask(const QString &taskName, const std::optional<TaskStep> &followUp)
{
    WaitingTask task;
    task.status.taskName = taskName;
    task.followUp = followUp;
    return task;
}

} // namespace

class TestNodeController : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    // Connection
    void testConnectToAnsweringNode();
    void testConnectFailsWhenProbeRejected();
    void testConnectWithoutAddressesFails();
    void testRequestsCarryAuthorizationAndSession();
    void testBusyConnectionFailsWithoutRetry();

    // Project status
    void testStatusChangeQueuesListAndProjectInfo();
    void testUnchangedCounterQueuesNothing();
    void testStatusDuringUploadDefersReconciliation();
    void testMalformedStatusUnloadsProject();
    void testStatusSkippedWithoutProject();
    void testPollingWithBusyQueueQueuesOnce();

    // Tasks
    void testFinishedTaskQueuesFollowUp();
    void testFailedTaskClearsAndAlerts();
    void testRunningTasksUpdateTable();
    void testMalformedTaskReportLeavesTableUntouched();

    // Prerequisites
    void testMissingProjectInjectsOpen();
    void testMissingProjectWithoutGuidSkips();

    // Front-end operations
    void testChangeToUnknownProjectCreatesIt();
    void testDeleteClosesOpenedProjectFirst();
    void testDeleteUnknownProjectAlerts();
    void testNodeProjectsReplaceList();
    void testDelayedPushWaitsForDelay();
    void testBackgroundSwitchSavesProject();

    // Task steps
    void testCommandForStepBuildsPipeline();
    void testComputeFollowUpDependsOnPointCount();

private:
    TestNodeEnvironment *env_ = nullptr;
    NodeController *node_ = nullptr;
};

void TestNodeController::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void TestNodeController::init()
{
    env_ = new TestNodeEnvironment();
    QVERIFY(env_->isValid());
    node_ = env_->controller();
}

void TestNodeController::cleanup()
{
    delete env_;
    env_ = nullptr;
    node_ = nullptr;
}

// --- Connection ---

void TestNodeController::testConnectToAnsweringNode()
{
    QSignalSpy spy(node_, &NodeController::connectionAttemptFinished);

    node_->startConnectionTo({QStringLiteral("127.0.0.1")}, QStringLiteral("SECRET"));

    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.first().at(0).toBool(), true);
    QVERIFY(node_->connection() != nullptr);
    QTRY_VERIFY(node_->scene().connected);
    QCOMPARE(node_->authToken(), QStringLiteral("SECRET"));

    const TestHttpServer::Request &probe = env_->server()->requests().first();
    QCOMPARE(probe.path, QByteArray("/node/connectuser"));
    QCOMPARE(probe.headers.value("authorization"), QByteArray("Bearer SECRET"));

    // Probe and node connection are separate sockets
    QTRY_VERIFY(env_->server()->connectionCount() >= 2);
}

void TestNodeController::testConnectFailsWhenProbeRejected()
{
    env_->route("/node/connectuser", TestHttpServer::jsonResponse(401, "{\"code\":401,\"message\":\"denied\"}"));
    QSignalSpy spy(node_, &NodeController::connectionAttemptFinished);

    node_->startConnectionTo({QStringLiteral("127.0.0.1")}, QStringLiteral("WRONG"));

    QTRY_COMPARE(spy.count(), 1);
    QCOMPARE(spy.first().at(0).toBool(), false);
    QVERIFY(node_->connection() == nullptr);
    QVERIFY(!node_->scene().connected);
}

void TestNodeController::testConnectWithoutAddressesFails()
{
    QSignalSpy spy(node_, &NodeController::connectionAttemptFinished);

    node_->startConnectionTo(QStringList(), QStringLiteral("SECRET"));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.first().at(0).toBool(), false);
}

void TestNodeController::testRequestsCarryAuthorizationAndSession()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    env_->route("/project/status", TestNodeEnvironment::statusResponse(0));
    node_->scene().openedProject.changeCounter = 0;

    node_->pushCommand(std::make_shared<GetProjectStatus>(node_));
    QVERIFY(env_->waitForIdle());

    const TestHttpServer::Request &request = env_->server()->requests().last();
    QCOMPARE(request.path, QByteArray("/project/status"));
    QCOMPARE(request.headers.value("authorization"), QByteArray("Bearer TOKEN"));
    QCOMPARE(request.headers.value("session"), QByteArray("S1"));
}

// --- Project status ---

void TestNodeController::testStatusChangeQueuesListAndProjectInfo()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    env_->route("/project/status", TestNodeEnvironment::statusResponse(3));
    env_->route("/project/list?folder=data",
                TestHttpServer::jsonResponse(200, "[\"a.jpg\",\"b.jpg\"]"));
    env_->route("/project/command?name=exportReport",
                TestHttpServer::jsonResponse(202, "{\"taskID\":\"t-info\"}"));

    node_->pushCommand(std::make_shared<GetProjectStatus>(node_));
    QVERIFY(env_->waitForIdle());

    const ProjectInfo &project = node_->scene().openedProject;
    QVERIFY(project.changeCounter == 3);
    QVERIFY(project.processID == 42);
    QVERIFY(project.fileList == QSet<QString>({"a.jpg", "b.jpg"}));
    QVERIFY(!project.update.has_value());

    const QStringList paths = env_->newPaths();
    QCOMPARE(paths.size(), 3);
    QCOMPARE(paths.at(0), QStringLiteral("/project/status"));
    QCOMPARE(paths.at(1), QStringLiteral("/project/list?folder=data"));
    QCOMPARE(paths.at(2), QStringLiteral("/project/command?name=exportReport&param1=")
                              + "crfly-projectinfo%28g1%29.json&param2=crfly-projectinfo.tpl");

    QVERIFY(project.waitingOnTask.contains(QStringLiteral("t-info")));
    const WaitingTask &task = project.waitingOnTask.value(QStringLiteral("t-info"));
    QCOMPARE(task.status.taskName, QStringLiteral("Evaluate Project Information"));
    QVERIFY(task.followUp.has_value());
    QVERIFY(*task.followUp == TaskStep::downloadTemplateExport(
                QStringLiteral("crfly-projectinfo(g1).json"), TemplateExportType::ProjectInfo));
}

void TestNodeController::testUnchangedCounterQueuesNothing()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    node_->scene().openedProject.changeCounter = 3;
    env_->route("/project/status", TestNodeEnvironment::statusResponse(3));

    node_->pushCommand(std::make_shared<GetProjectStatus>(node_));
    QVERIFY(env_->waitForIdle());

    QCOMPARE(env_->newPaths(), QStringList({"/project/status"}));
}

void TestNodeController::testStatusDuringUploadDefersReconciliation()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    node_->scene().openedProject.changeCounter = 1;
    node_->scene().mediaUpload = MediaUploadState();
    node_->scene().mediaUpload->paused = true;
    env_->route("/project/status", TestNodeEnvironment::statusResponse(2));

    node_->pushCommand(std::make_shared<GetProjectStatus>(node_));
    QVERIFY(env_->waitForIdle());

    QCOMPARE(env_->newPaths(), QStringList({"/project/status"}));
    QVERIFY(node_->scene().openedProject.changeCounter == 1);
    QVERIFY(node_->scene().openedProject.progress == 0.5);
}

void TestNodeController::testMalformedStatusUnloadsProject()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    env_->route("/project/status", TestHttpServer::jsonResponse(200, "{\"progress\":0.5}"));
    QSignalSpy unloaded(node_, &NodeController::projectUnloaded);

    node_->pushCommand(std::make_shared<GetProjectStatus>(node_));
    QVERIFY(env_->waitForIdle());

    QCOMPARE(unloaded.count(), 1);
    QCOMPARE(env_->alerts().defaultViewRequests, 1);
    QVERIFY(!node_->scene().openedProject.loaded);
    QCOMPARE(node_->scene().openedProject.name, QString::fromLatin1(NoProjectName));
    QCOMPARE(env_->alerts().count(), 1);
    QCOMPARE(env_->alerts().lastTitle(), QStringLiteral("Error Getting RCNode Project Status"));
    QVERIFY(node_->scene().connected);
}

void TestNodeController::testStatusSkippedWithoutProject()
{
    QVERIFY(env_->connectNode());

    node_->pushCommand(std::make_shared<GetProjectStatus>(node_));
    QVERIFY(env_->waitForIdle());

    QVERIFY(env_->newPaths().isEmpty());
    QCOMPARE(env_->alerts().count(), 0);

    // Nothing was open, so the front end stays where it is
    node_->projectUnload();
    QCOMPARE(env_->alerts().defaultViewRequests, 0);
}

void TestNodeController::testBusyConnectionFailsWithoutRetry()
{
    QVERIFY(env_->connectNode());
    const int connections = env_->server()->connectionCount();
    env_->server()->setResponding(false);

    bool firstAnswered = false;
    node_->connection()->send(node_->constructRequest(QStringLiteral("/node/status")),
                              [&firstAnswered](const TransportResult &result) {
        firstAnswered = result.ok();
    });
    QTRY_COMPARE(env_->server()->heldCount(), 1);

    bool finished = false;
    bool succeeded = true;
    bool retryable = true;
    std::optional<CommandError> error;
    auto command = std::make_shared<GetNodeStatus>(node_);
    command->execute([&](bool success, bool isRetryable, const std::optional<CommandError> &err) {
        finished = true;
        succeeded = success;
        retryable = isRetryable;
        error = err;
    });

    QVERIFY(finished);
    QVERIFY(!succeeded);
    QVERIFY(!retryable);
    QVERIFY(error.has_value());
    QCOMPARE(error->title, QStringLiteral("Error Getting RCNode Status"));
    QVERIFY(node_->connection()->isConnected());

    // The transfer already in progress is unaffected
    env_->server()->setResponding(true);
    env_->server()->answerHeld();
    QTRY_VERIFY(firstAnswered);
    QCOMPARE(env_->server()->connectionCount(), connections);
}

void TestNodeController::testPollingWithBusyQueueQueuesOnce()
{
    env_->setPollInterval(20);
    env_->loadSurveyProject();
    node_->scene().openedProject.waitingOnTask.insert(QStringLiteral("t1"),
                                                      waitingTask(QStringLiteral("Align Images"), std::nullopt));

    // Occupies the queue for the rest of the test
    auto blocker = std::make_shared<MockCommand>(QStringLiteral("Blocker"));
    blocker->deferred = true;
    node_->pushCommand(blocker);

    QVERIFY(env_->attachNode());
    QTRY_COMPARE(blocker->executions, 1);
    QTest::qWait(200);

    QCOMPARE(node_->queue()->pendingCommandNames(),
             QStringList({"GetProjectTasks", "GetProjectStatus"}));
}

// --- Tasks ---

void TestNodeController::testFinishedTaskQueuesFollowUp()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    ProjectInfo &project = node_->scene().openedProject;
    project.changeCounter = 0;
    project.waitingOnTask.insert(QStringLiteral("t1"),
                                 waitingTask(QStringLiteral("Align Images"), TaskStep::projectStatus()));
    env_->route("/project/tasks", TestHttpServer::jsonResponse(200, "[" + taskReport("t1", "finished") + "]"));
    env_->route("/project/status", TestNodeEnvironment::statusResponse(0));

    node_->pushCommand(std::make_shared<GetProjectTasks>(node_, project.pendingTaskIds()));
    QVERIFY(env_->waitForIdle());

    QVERIFY(node_->scene().openedProject.waitingOnTask.isEmpty());
    QCOMPARE(env_->newPaths(), QStringList({"/project/tasks?taskIDs=t1", "/project/status"}));
}

void TestNodeController::testFailedTaskClearsAndAlerts()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    ProjectInfo &project = node_->scene().openedProject;
    project.waitingOnTask.insert(QStringLiteral("t1"),
                                 waitingTask(QStringLiteral("Align Images"), TaskStep::projectStatus()));
    env_->route("/project/tasks",
                TestHttpServer::jsonResponse(200, "[" + taskReport("t1", "failed", 7, "Out of memory") + "]"));

    node_->pushCommand(std::make_shared<GetProjectTasks>(node_, project.pendingTaskIds()));
    QVERIFY(env_->waitForIdle());

    QVERIFY(node_->scene().openedProject.waitingOnTask.isEmpty());
    QCOMPARE(env_->newPaths(), QStringList({"/project/tasks?taskIDs=t1", "/project/cleartasks?taskIds=t1"}));
    QCOMPARE(env_->alerts().count(), 1);
    QCOMPARE(env_->alerts().lastTitle(), QStringLiteral("Error Executing RCNode Task"));
    QVERIFY(env_->alerts().lastMessage().contains(QStringLiteral("Align Images")));
    QVERIFY(env_->alerts().lastMessage().contains(QStringLiteral("7")));
    QVERIFY(env_->alerts().lastMessage().contains(QStringLiteral("Out of memory")));
}

void TestNodeController::testRunningTasksUpdateTable()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    ProjectInfo &project = node_->scene().openedProject;
    project.waitingOnTask.insert(QStringLiteral("t1"),
                                 waitingTask(QStringLiteral("Calculating Model"),
                                             TaskStep::exportSelected(ModelType::Preview)));
    env_->route("/project/tasks",
                TestHttpServer::jsonResponse(200, "[" + taskReport("t1", "started") + ","
                                                      + taskReport("rc-7", "scheduled") + "]"));

    node_->pushCommand(std::make_shared<GetProjectTasks>(node_, project.pendingTaskIds()));
    QVERIFY(env_->waitForIdle());

    const QMap<QString, WaitingTask> &waiting = node_->scene().openedProject.waitingOnTask;
    QCOMPARE(waiting.size(), 2);
    const WaitingTask running = waiting.value(QStringLiteral("t1"));
    QCOMPARE(running.status.state, QStringLiteral("started"));
    QVERIFY(running.status.timeStart == qint64(10));
    QVERIFY(*running.followUp == TaskStep::exportSelected(ModelType::Preview));

    const WaitingTask external = waiting.value(QStringLiteral("rc-7"));
    QCOMPARE(external.status.taskName, QStringLiteral("RealityCaptureTask"));
    QCOMPARE(external.status.state, QStringLiteral("scheduled"));
    QVERIFY(!external.followUp.has_value());
}

void TestNodeController::testMalformedTaskReportLeavesTableUntouched()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    ProjectInfo &project = node_->scene().openedProject;
    project.waitingOnTask.insert(QStringLiteral("t1"),
                                 waitingTask(QStringLiteral("Align Images"), TaskStep::projectStatus()));
    env_->route("/project/tasks",
                TestHttpServer::jsonResponse(200, "[" + taskReport("t1", "finished")
                                                      + ",{\"taskID\":\"t2\"}]"));

    node_->pushCommand(std::make_shared<GetProjectTasks>(node_, project.pendingTaskIds()));
    QVERIFY(env_->waitForIdle());

    const QMap<QString, WaitingTask> &waiting = node_->scene().openedProject.waitingOnTask;
    QCOMPARE(waiting.size(), 1);
    QVERIFY(waiting.value(QStringLiteral("t1")).status.state.isEmpty());
    QCOMPARE(env_->newPaths(), QStringList({"/project/tasks?taskIDs=t1"}));
    QCOMPARE(env_->alerts().count(), 1);
    QCOMPARE(env_->alerts().lastTitle(), QStringLiteral("Error Getting RCNode Project Tasks Statuses"));
}

// --- Prerequisites ---

void TestNodeController::testMissingProjectInjectsOpen()
{
    QVERIFY(env_->connectNode());
    SceneState &scene = node_->scene();
    scene.projectList.insert(QStringLiteral("survey"), 1700000000);
    scene.projectGuids.insert(QStringLiteral("survey"), QStringLiteral("g1"));
    scene.lastProjectName = QStringLiteral("survey");
    env_->route("/project/open", TestHttpServer::response(200, QByteArray(), "Session: S9\r\n"));
    env_->route("/project/list?folder=data", TestHttpServer::jsonResponse(200, "[\"x.jpg\"]"));
    QSignalSpy loaded(node_, &NodeController::projectLoaded);

    node_->pushCommand(std::make_shared<GetProjectList>(node_, GetProjectList::Folder::Data));
    QVERIFY(env_->waitForIdle());

    QCOMPARE(loaded.count(), 1);
    QCOMPARE(loaded.first().at(0).toString(), QStringLiteral("survey"));
    QVERIFY(scene.openedProject.sessionId == QStringLiteral("S9"));
    QVERIFY(scene.openedProject.fileList == QSet<QString>({"x.jpg"}));

    const QStringList paths = env_->newPaths();
    QVERIFY(paths.size() >= 2);
    QCOMPARE(paths.at(0), QStringLiteral("/project/open?guid=g1"));
    QCOMPARE(paths.at(1), QStringLiteral("/project/list?folder=data"));
    QVERIFY(paths.contains(QStringLiteral("/project/upload?name=crfly-projectinfo.tpl&folder=output")));
    QVERIFY(paths.contains(QStringLiteral("/project/upload?name=crfly-pointcloud.tpl&folder=output")));
    QVERIFY(paths.contains(QStringLiteral("/project/upload?name=crfly-aligncameras.tpl&folder=output")));
    QCOMPARE(env_->alerts().count(), 0);
}

void TestNodeController::testMissingProjectWithoutGuidSkips()
{
    QVERIFY(env_->connectNode());

    node_->pushCommand(std::make_shared<GetProjectList>(node_, GetProjectList::Folder::Data));
    QVERIFY(env_->waitForIdle());

    QVERIFY(env_->newPaths().isEmpty());
    QCOMPARE(env_->alerts().count(), 0);
}

// --- Front-end operations ---

void TestNodeController::testChangeToUnknownProjectCreatesIt()
{
    QVERIFY(env_->connectNode());
    env_->route("/project/create", TestHttpServer::response(201, QByteArray(), "Session: S2\r\n"));
    env_->route("/project/save", TestHttpServer::response(202));
    env_->route("/project/list?folder=output", TestHttpServer::jsonResponse(200, "[]"));

    node_->manageProject(ProjectAction::changeTo(QStringLiteral("field day")));
    QVERIFY(env_->waitForIdle());

    const ProjectInfo &project = node_->scene().openedProject;
    QVERIFY(project.loaded);
    QCOMPARE(project.name, QStringLiteral("field day"));
    QVERIFY(project.sessionId == QStringLiteral("S2"));
    QCOMPARE(node_->scene().lastProjectName, QStringLiteral("field day"));

    const QStringList paths = env_->newPaths();
    QCOMPARE(paths.first(), QStringLiteral("/project/create"));
    QVERIFY(paths.contains(QStringLiteral("/project/list?folder=output")));
    QVERIFY(paths.contains(QStringLiteral("/project/save?name=field%20day")));
    QCOMPARE(env_->alerts().count(), 0);
}

void TestNodeController::testDeleteClosesOpenedProjectFirst()
{
    QVERIFY(env_->connectNode());
    env_->loadSurveyProject();
    QSignalSpy unloaded(node_, &NodeController::projectUnloaded);

    node_->manageProject(ProjectAction::remove());
    QVERIFY(env_->waitForIdle());

    QCOMPARE(env_->newPaths(), QStringList({"/project/close", "/project/delete?guid=g1"}));
    QCOMPARE(unloaded.count(), 1);
    QVERIFY(!node_->scene().projectList.contains(QStringLiteral("survey")));
    QVERIFY(!node_->scene().projectGuids.contains(QStringLiteral("survey")));
}

void TestNodeController::testDeleteUnknownProjectAlerts()
{
    QVERIFY(env_->connectNode());

    node_->manageProject(ProjectAction::remove());

    QCOMPARE(env_->alerts().count(), 1);
    QCOMPARE(env_->alerts().lastTitle(), QStringLiteral("Error Deleting RCNode Project"));
    QCOMPARE(node_->queue()->commandInQueueCount(), 0);
}

void TestNodeController::testNodeProjectsReplaceList()
{
    QVERIFY(env_->connectNode());
    env_->route("/node/projects", TestHttpServer::jsonResponse(
        200, "[{\"name\":\"survey\",\"guid\":\"g1\",\"timeStamp\":1700000000},"
             "{\"name\":\"quarry\",\"guid\":\"g2\",\"timeStamp\":1700000500}]"));

    node_->pushCommand(std::make_shared<GetNodeProjects>(node_));
    QVERIFY(env_->waitForIdle());

    const SceneState &scene = node_->scene();
    QCOMPARE(scene.projectList.size(), 2);
    QCOMPARE(scene.projectList.value(QStringLiteral("quarry")), qint64(1700000500));
    QCOMPARE(scene.projectGuids.value(QStringLiteral("survey")), QStringLiteral("g1"));
    QVERIFY(scene.projectNameForGuid(QStringLiteral("g2")) == QStringLiteral("quarry"));

    // An empty list falls back to the placeholder entry
    env_->clearRoutes();
    env_->route("/node/projects", TestHttpServer::jsonResponse(200, "[]"));
    node_->pushCommand(std::make_shared<GetNodeProjects>(node_));
    QVERIFY(env_->waitForIdle());
    QCOMPARE(scene.projectList.keys(), QStringList({QString::fromLatin1(NoProjectName)}));
    QVERIFY(scene.projectGuids.isEmpty());
}

// --- Task steps ---

void TestNodeController::testCommandForStepBuildsPipeline()
{
    env_->loadSurveyProject();

    auto align = std::dynamic_pointer_cast<CalculateModel>(
        node_->commandForStep(TaskStep::computeModel(ModelType::Alignment)));
    QVERIFY(align);
    QCOMPARE(align->model(), ModelType::Alignment);
    QCOMPARE(align->task().path, QStringLiteral("/project/command?name=align"));
    QVERIFY(*align->task().followUp == TaskStep::projectStatus());

    auto calculate = std::dynamic_pointer_cast<CalculateModel>(
        node_->commandForStep(TaskStep::calculateModel(ModelType::Preview)));
    QVERIFY(calculate);
    QCOMPARE(calculate->task().path, QStringLiteral("/project/command?name=setReconstructionRegionAuto"));
    QVERIFY(*calculate->task().followUp == TaskStep::selectTriangles(ModelType::Preview));

    auto select = std::dynamic_pointer_cast<SelectTriangles>(
        node_->commandForStep(TaskStep::selectTriangles(ModelType::Preview)));
    QVERIFY(select);
    QVERIFY(*select->task().followUp == TaskStep::computeModel(ModelType::Preview));

    auto exportModel = std::dynamic_pointer_cast<ExportSelectedModel>(
        node_->commandForStep(TaskStep::exportSelected(ModelType::Colorized)));
    QVERIFY(exportModel);
    QCOMPARE(exportModel->task().path,
             QStringLiteral("/project/command?name=exportModelToZip&param1=Colorized%20Texture.zip&param2=obj"));
    QVERIFY(*exportModel->task().followUp == TaskStep::downloadModel(ModelType::Colorized));

    auto download = std::dynamic_pointer_cast<DownloadModel>(
        node_->commandForStep(TaskStep::downloadModel(ModelType::Colorized)));
    QVERIFY(download);
    QCOMPARE(download->model(), ModelType::Colorized);

    QVERIFY(std::dynamic_pointer_cast<GetProjectStatus>(node_->commandForStep(TaskStep::projectStatus())));
    QVERIFY(std::dynamic_pointer_cast<DownloadTemplateExport>(node_->commandForStep(
        TaskStep::downloadTemplateExport(QStringLiteral("crfly-pointcloud(g1).json"),
                                         TemplateExportType::PointCloud))));
}

void TestNodeController::testComputeFollowUpDependsOnPointCount()
{
    env_->loadSurveyProject();

    node_->scene().openedProject.pointCount = 5000;
    auto small = std::dynamic_pointer_cast<ComputeModel>(
        node_->commandForStep(TaskStep::computeModel(ModelType::Normal)));
    QVERIFY(small);
    QCOMPARE(small->task().path, QStringLiteral("/project/command?name=calculateNormalModel"));
    QCOMPARE(small->task().taskName, QStringLiteral("Calculating Model"));
    QVERIFY(*small->task().followUp == TaskStep::exportSelected(ModelType::Normal));

    node_->scene().openedProject.pointCount = NodeController::SimplifyPointThreshold + 1;
    auto large = std::dynamic_pointer_cast<ComputeModel>(
        node_->commandForStep(TaskStep::computeModel(ModelType::Normal)));
    QVERIFY(large);
    QVERIFY(*large->task().followUp == TaskStep::simplifyAndExport(ModelType::Normal));

    auto simplify = std::dynamic_pointer_cast<SimplifyAndExportModel>(
        node_->commandForStep(TaskStep::simplifyAndExport(ModelType::Normal)));
    QVERIFY(simplify);
    QVERIFY(*simplify->task().followUp == TaskStep::exportSelected(ModelType::Normal));
}

void TestNodeController::testDelayedPushWaitsForDelay()
{
    QStringList log;
    node_->pushCommandDelayed(std::make_shared<MockCommand>("Later", &log), 100);

    QVERIFY(node_->queue()->pendingCommandNames().isEmpty());
    QTRY_COMPARE(node_->queue()->pendingCommandNames(), QStringList({"Later"}));
    QVERIFY(log.isEmpty());
}

void TestNodeController::testBackgroundSwitchSavesProject()
{
    env_->loadSurveyProject();

    node_->leaveToBackground();
    QVERIFY(node_->inBackground());
    QCOMPARE(node_->queue()->pendingCommandNames(), QStringList({"GetProjectSave"}));

    node_->enterFromBackground();
    QVERIFY(!node_->inBackground());
}

QTEST_MAIN(TestNodeController)
#include "test_nodecontroller.moc"
