#ifndef DOSEPROFILE_VISUALIZATION_PROFILE_TOOL_WINDOW_H
#define DOSEPROFILE_VISUALIZATION_PROFILE_TOOL_WINDOW_H

#include "app/profile_tool.h"
#include "app/tool_settings.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QWidget>

namespace DoseProfile {

// プロファイル抽出ツールのメインウィンドウ
class ProfileToolWindow : public QWidget {
  Q_OBJECT
  Q_DISABLE_COPY_MOVE(ProfileToolWindow)
public:
  explicit ProfileToolWindow(const ToolSettings &settings, QWidget *parent = nullptr);

  ProfileOptions currentOptions() const;

private slots:
  void onBrowseDicom();
  void onBrowsePoints();
  void onWriteProfiles();
  void onViewDicomInfo();

private:
  void setupUi();
  void applySettings(const ToolSettings &settings);
  void storeSettings() const;
  // Loads the folder when it differs from the one already loaded
  bool ensureLoaded();
  void updateStatus();

  ProfileTool m_tool;
  QString m_loadedFolder;
  ProfileOptions m_baseOptions;

  QLineEdit *m_dicomEdit{nullptr};
  QLineEdit *m_pointsEdit{nullptr};
  QDoubleSpinBox *m_spacingSpin{nullptr};
  QComboBox *m_interpCombo{nullptr};
  QComboBox *m_unitsCombo{nullptr};
  QCheckBox *m_zeroPointCheck{nullptr};
  QCheckBox *m_normalizeCheck{nullptr};
  QPushButton *m_writeButton{nullptr};
  QPushButton *m_infoButton{nullptr};
  QLabel *m_statusLabel{nullptr};
  QString m_lastOutput;
};

} // namespace DoseProfile

#endif // DOSEPROFILE_VISUALIZATION_PROFILE_TOOL_WINDOW_H
