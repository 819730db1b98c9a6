#ifndef TASKLINE_UI_CONSOLEUI_HPP
#define TASKLINE_UI_CONSOLEUI_HPP

#include <QTextStream>
#include <memory>
#include <vector>

#include "ITaskService.hpp"

// Interactive menu over stdin/stdout.
class ConsoleUi {
public:
    ConsoleUi(std::shared_ptr<ITaskService> service, QTextStream &in, QTextStream &out);

    // Returns when the user picks Exit or input ends.
    void run();

private:
    QString prompt(const QString &label);

    void displayTasks(const std::vector<Task> &tasks);
    void displayStatistics();

    void addTask();
    void listTasks();
    void markComplete();
    void deleteTask();
    void searchTasks();

    std::shared_ptr<ITaskService> m_service;
    QTextStream &m_in;
    QTextStream &m_out;
};

#endif // TASKLINE_UI_CONSOLEUI_HPP
