#ifndef TASKLINE_MODEL_TASKSTATISTICS_HPP
#define TASKLINE_MODEL_TASKSTATISTICS_HPP

#include <QtGlobal>

struct TaskStatistics {
    qint64 total = 0;
    qint64 pending = 0;
    qint64 completed = 0;
    qint64 createdToday = 0;

    bool operator==(const TaskStatistics &other) const {
        return total == other.total && pending == other.pending &&
               completed == other.completed &&
               createdToday == other.createdToday;
    }
};

#endif // TASKLINE_MODEL_TASKSTATISTICS_HPP
