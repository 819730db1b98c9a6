#include "ConsoleUi.hpp"

#include "ErrorHandler.hpp"
#include "Logger.hpp"

namespace {

QString formatRow(const QString &id, const QString &title, const QString &status,
                  const QString &created, const QString &description) {
    return id.leftJustified(5) + ' ' + title.leftJustified(25) + ' ' +
           status.leftJustified(10) + ' ' + created.leftJustified(20) + ' ' +
           description.leftJustified(30);
}

} // END NAMESPACE

ConsoleUi::ConsoleUi(std::shared_ptr<ITaskService> service, QTextStream &in,
                     QTextStream &out)
    : m_service(std::move(service)), m_in(in), m_out(out) {}

QString ConsoleUi::prompt(const QString &label) {
    m_out << label << Qt::flush;
    return m_in.readLine();
}

void ConsoleUi::displayTasks(const std::vector<Task> &tasks) {
    if (tasks.empty()) {
        m_out << "No tasks found." << Qt::endl;
        return;
    }

    m_out << '\n' << QString(80, '=') << '\n';
    m_out << formatRow("ID", "TITLE", "STATUS", "CREATED DATE", "DESCRIPTION") << '\n';
    m_out << QString(80, '-') << '\n';

    for (const Task &task : tasks) {
        m_out << formatRow(QString::number(task.id), task.title.left(23),
                           statusToString(task.status), task.createdDateString(),
                           task.description.left(28))
              << '\n';
    }

    m_out << QString(80, '=') << '\n' << Qt::endl;
}

void ConsoleUi::displayStatistics() {
    const TaskStatistics stats = m_service->getStatistics();
    m_out << '\n' << QString(40, '=') << '\n'
          << "TASK STATISTICS" << '\n'
          << QString(40, '-') << '\n'
          << "Total Tasks: " << stats.total << '\n'
          << "Pending Tasks: " << stats.pending << '\n'
          << "Completed Tasks: " << stats.completed << '\n'
          << "Tasks Created Today: " << stats.createdToday << '\n'
          << QString(40, '=') << '\n' << Qt::endl;
}

void ConsoleUi::addTask() {
    m_out << "\n== Add New Task ==" << Qt::endl;
    const QString title = prompt("Enter task title: ");
    const QString description = prompt("Enter task description: ");

    const Task task = m_service->addTask(title, description);
    m_out << QStringLiteral("Task '%1' added successfully with ID %2!")
                 .arg(task.title, QString::number(task.id))
          << Qt::endl;
}

void ConsoleUi::listTasks() {
    displayTasks(m_service->listTasks());
}

void ConsoleUi::markComplete() {
    const QString taskId = prompt("Enter task ID to mark as complete: ");
    const Task task = m_service->markComplete(taskId);
    m_out << QStringLiteral("Task '%1' marked as completed!").arg(task.title) << Qt::endl;
}

void ConsoleUi::deleteTask() {
    const QString taskId = prompt("Enter task ID to delete: ");
    const Task task = m_service->deleteTask(taskId);
    m_out << QStringLiteral("Task '%1' deleted successfully!").arg(task.title) << Qt::endl;
}

void ConsoleUi::searchTasks() {
    const QString keyword = prompt("Enter search keyword: ");
    const auto tasks = m_service->searchTasks(keyword);
    if (tasks.empty()) {
        m_out << QStringLiteral("No tasks found matching '%1'").arg(keyword) << Qt::endl;
        return;
    }

    m_out << QStringLiteral("Found %1 matching tasks:").arg(tasks.size()) << Qt::endl;
    displayTasks(tasks);
}

void ConsoleUi::run() {
    while (true) {
        m_out << "\nTASK MANAGER\n"
              << "1. Add Task\n"
              << "2. List Tasks\n"
              << "3. Mark Task as Complete\n"
              << "4. Delete Task\n"
              << "5. Search Tasks\n"
              << "6. View Statistics\n"
              << "7. Exit\n";

        const QString choice = prompt("Enter your choice (1-7): ").trimmed();
        if (m_in.atEnd() && choice.isEmpty()) {
            break;
        }

        if (choice == "1") {
            runSafe("add task", m_out, [this] { addTask(); });
        } else if (choice == "2") {
            runSafe("list tasks", m_out, [this] { listTasks(); });
        } else if (choice == "3") {
            runSafe("mark complete", m_out, [this] { markComplete(); });
        } else if (choice == "4") {
            runSafe("delete task", m_out, [this] { deleteTask(); });
        } else if (choice == "5") {
            runSafe("search tasks", m_out, [this] { searchTasks(); });
        } else if (choice == "6") {
            runSafe("statistics", m_out, [this] { displayStatistics(); });
        } else if (choice == "7") {
            m_out << "Exiting Task Manager. Goodbye!" << Qt::endl;
            break;
        } else {
            m_out << "Invalid choice. Please try again." << Qt::endl;
        }
    }

    qInfo(appUi) << "Console session finished";
}
