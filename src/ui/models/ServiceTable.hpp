#pragma once

#include "core/service_instance.hpp"

#include <QAbstractListModel>
#include <QStringList>
#include <map>
#include <vector>

namespace lantern::ui {

/**
 * ServiceTable - Display-ready state of the active discovery session.
 *
 * Holds the service types seen so far and the resolved instances keyed by
 * name. Rows are the visible instances: sorted by name, restricted to types
 * containing the filter text. Lives on the consumer thread and is only
 * mutated through the on*() slots fed by the EventBridge.
 */
class ServiceTable : public QAbstractListModel {
    Q_OBJECT

    Q_PROPERTY(QStringList types READ types NOTIFY typesChanged)
    Q_PROPERTY(QString filter READ filter WRITE setFilter NOTIFY filterChanged)
    Q_PROPERTY(int instanceCount READ instanceCount NOTIFY instancesChanged)

public:
    enum Roles {
        NameRole = Qt::UserRole + 1,
        TypeRole,
        AddressesRole,
        PortRole,
        ServerRole
    };

    explicit ServiceTable(QObject* parent = nullptr);

    // QAbstractListModel interface
    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    [[nodiscard]] QStringList types() const { return types_; }
    [[nodiscard]] QString filter() const { return filter_; }
    [[nodiscard]] int instanceCount() const { return static_cast<int>(instances_.size()); }

    [[nodiscard]] const ServiceInstance* instance(const QString& name) const;
    [[nodiscard]] std::vector<ServiceInstance> visibleInstances() const;

    void setFilter(const QString& type);
    // Selecting the active filter again clears it.
    void toggleFilter(const QString& type);
    void clearFilter();

    void clear();

public slots:
    void onTypeFound(const QString& type);
    void onInstanceAdded(const QString& name, const lantern::ServiceInstance& instance);
    void onInstanceRemoved(const QString& name);

signals:
    void typesChanged();
    void filterChanged();
    void instancesChanged();

private:
    [[nodiscard]] bool matchesFilter(const ServiceInstance& instance) const;
    void rebuildRows();

    QStringList types_;
    std::map<QString, ServiceInstance> instances_;
    QString filter_;
    std::vector<QString> rows_;
};

} // namespace lantern::ui
