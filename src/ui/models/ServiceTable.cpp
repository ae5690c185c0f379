#include "ui/models/ServiceTable.hpp"

#include <algorithm>

namespace lantern::ui {

ServiceTable::ServiceTable(QObject* parent)
    : QAbstractListModel(parent)
{
}

int ServiceTable::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return static_cast<int>(rows_.size());
}

QVariant ServiceTable::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() >= static_cast<int>(rows_.size())) {
        return QVariant();
    }

    const auto it = instances_.find(rows_[index.row()]);
    if (it == instances_.end()) {
        return QVariant();
    }
    const auto& instance = it->second;

    switch (role) {
        case Qt::DisplayRole:
        case NameRole:
            return instance.name;
        case TypeRole:
            return instance.type;
        case AddressesRole:
            return instance.addresses;
        case PortRole:
            return static_cast<int>(instance.port);
        case ServerRole:
            return instance.server.value_or(QString{});
        default:
            return QVariant();
    }
}

QHash<int, QByteArray> ServiceTable::roleNames() const {
    return {
        {NameRole, "name"},
        {TypeRole, "type"},
        {AddressesRole, "addresses"},
        {PortRole, "port"},
        {ServerRole, "server"}
    };
}

const ServiceInstance* ServiceTable::instance(const QString& name) const {
    const auto it = instances_.find(name);
    return it == instances_.end() ? nullptr : &it->second;
}

std::vector<ServiceInstance> ServiceTable::visibleInstances() const {
    std::vector<ServiceInstance> visible;
    visible.reserve(rows_.size());
    for (const auto& name : rows_) {
        visible.push_back(instances_.at(name));
    }
    return visible;
}

void ServiceTable::setFilter(const QString& type) {
    if (filter_ == type) return;
    filter_ = type;
    rebuildRows();
    emit filterChanged();
}

void ServiceTable::toggleFilter(const QString& type) {
    setFilter(filter_ == type ? QString{} : type);
}

void ServiceTable::clearFilter() {
    setFilter(QString{});
}

void ServiceTable::clear() {
    const bool hadTypes = !types_.isEmpty();
    const bool hadFilter = !filter_.isEmpty();

    types_.clear();
    instances_.clear();
    filter_.clear();
    rebuildRows();

    if (hadTypes) emit typesChanged();
    if (hadFilter) emit filterChanged();
}

void ServiceTable::onTypeFound(const QString& type) {
    const auto pos = std::lower_bound(types_.begin(), types_.end(), type);
    if (pos != types_.end() && *pos == type) return;
    types_.insert(pos, type);
    emit typesChanged();
}

void ServiceTable::onInstanceAdded(const QString& name, const lantern::ServiceInstance& instance) {
    instances_[name] = instance;
    rebuildRows();
}

void ServiceTable::onInstanceRemoved(const QString& name) {
    if (instances_.erase(name) == 0) return;
    rebuildRows();
}

bool ServiceTable::matchesFilter(const ServiceInstance& instance) const {
    return filter_.isEmpty() || instance.type.contains(filter_);
}

void ServiceTable::rebuildRows() {
    beginResetModel();
    rows_.clear();
    for (const auto& [name, instance] : instances_) {
        if (matchesFilter(instance)) {
            rows_.push_back(name);
        }
    }
    endResetModel();
    emit instancesChanged();
}

} // namespace lantern::ui
