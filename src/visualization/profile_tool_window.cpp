#include "visualization/profile_tool_window.h"

#include "core/errors.h"
#include "core/logging.h"

#include <QDialog>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QTabWidget>
#include <QVBoxLayout>

namespace DoseProfile {

ProfileToolWindow::ProfileToolWindow(const ToolSettings &settings, QWidget *parent)
    : QWidget(parent) {
  setupUi();
  applySettings(settings);
  updateStatus();
}

void ProfileToolWindow::setupUi() {
  setWindowTitle(tr("DICOM Dose Profile Tool"));
  setMinimumWidth(560);

  QVBoxLayout *mainLayout = new QVBoxLayout(this);
  QFormLayout *form = new QFormLayout();

  QHBoxLayout *dicomRow = new QHBoxLayout();
  m_dicomEdit = new QLineEdit(this);
  QPushButton *dicomBrowse = new QPushButton(tr("Browse..."), this);
  dicomRow->addWidget(m_dicomEdit);
  dicomRow->addWidget(dicomBrowse);
  form->addRow(tr("DICOM folder:"), dicomRow);
  connect(dicomBrowse, &QPushButton::clicked, this, &ProfileToolWindow::onBrowseDicom);

  QHBoxLayout *pointsRow = new QHBoxLayout();
  m_pointsEdit = new QLineEdit(this);
  QPushButton *pointsBrowse = new QPushButton(tr("Browse..."), this);
  pointsRow->addWidget(m_pointsEdit);
  pointsRow->addWidget(pointsBrowse);
  form->addRow(tr("Profile points file:"), pointsRow);
  connect(pointsBrowse, &QPushButton::clicked, this, &ProfileToolWindow::onBrowsePoints);

  m_spacingSpin = new QDoubleSpinBox(this);
  m_spacingSpin->setDecimals(3);
  m_spacingSpin->setRange(0.001, 10.0);
  m_spacingSpin->setSingleStep(0.05);
  m_spacingSpin->setSuffix(tr(" cm"));
  form->addRow(tr("Point spacing:"), m_spacingSpin);

  m_interpCombo = new QComboBox(this);
  m_interpCombo->addItem(tr("Nearest Neighbor"), interpolationMethodName(InterpolationMethod::Nearest));
  m_interpCombo->addItem(tr("Linear"), interpolationMethodName(InterpolationMethod::Linear));
  form->addRow(tr("Interpolation:"), m_interpCombo);

  m_unitsCombo = new QComboBox(this);
  m_unitsCombo->addItem(doseUnitLabel(DoseUnit::CGy), doseUnitCode(DoseUnit::CGy));
  m_unitsCombo->addItem(doseUnitLabel(DoseUnit::Gy), doseUnitCode(DoseUnit::Gy));
  form->addRow(tr("Dose units:"), m_unitsCombo);

  m_zeroPointCheck = new QCheckBox(tr("Zero point at surface / CAX"), this);
  form->addRow(QString(), m_zeroPointCheck);
  m_normalizeCheck = new QCheckBox(tr("Normalize by MU"), this);
  form->addRow(QString(), m_normalizeCheck);

  mainLayout->addLayout(form);

  QHBoxLayout *buttonRow = new QHBoxLayout();
  m_infoButton = new QPushButton(tr("View DICOM Info"), this);
  m_writeButton = new QPushButton(tr("Write Profiles"), this);
  buttonRow->addStretch();
  buttonRow->addWidget(m_infoButton);
  buttonRow->addWidget(m_writeButton);
  mainLayout->addLayout(buttonRow);
  connect(m_infoButton, &QPushButton::clicked, this, &ProfileToolWindow::onViewDicomInfo);
  connect(m_writeButton, &QPushButton::clicked, this, &ProfileToolWindow::onWriteProfiles);

  m_statusLabel = new QLabel(this);
  m_statusLabel->setWordWrap(true);
  mainLayout->addWidget(m_statusLabel);

  connect(m_dicomEdit, &QLineEdit::textChanged, this, [this]() { updateStatus(); });
  connect(m_pointsEdit, &QLineEdit::textChanged, this, [this]() { updateStatus(); });
}

void ProfileToolWindow::applySettings(const ToolSettings &settings) {
  m_baseOptions = settings.options;
  m_lastOutput = settings.outputFile;
  m_dicomEdit->setText(settings.dicomFolder);
  m_pointsEdit->setText(settings.pointsFile);
  m_spacingSpin->setValue(settings.options.spacing);
  m_interpCombo->setCurrentIndex(
      m_interpCombo->findData(interpolationMethodName(settings.options.interpolation)));
  m_unitsCombo->setCurrentIndex(m_unitsCombo->findData(doseUnitCode(settings.options.doseUnit)));
  m_zeroPointCheck->setChecked(settings.options.zeroPoint == ZeroPoint::Mode::CaxSurfaceIntercept);
  m_normalizeCheck->setChecked(settings.options.normalizeByMonitorUnits);
}

ProfileOptions ProfileToolWindow::currentOptions() const {
  ProfileOptions options = m_baseOptions;
  options.spacing = m_spacingSpin->value();
  options.interpolation = parseInterpolationMethod(m_interpCombo->currentData().toString());
  options.doseUnit = parseDoseUnit(m_unitsCombo->currentData().toString());
  options.zeroPoint = m_zeroPointCheck->isChecked() ? ZeroPoint::Mode::CaxSurfaceIntercept
                                                    : ZeroPoint::Mode::Origin;
  options.normalizeByMonitorUnits = m_normalizeCheck->isChecked();
  return options;
}

void ProfileToolWindow::storeSettings() const {
  ToolSettings settings;
  settings.options = currentOptions();
  settings.dicomFolder = m_dicomEdit->text();
  settings.pointsFile = m_pointsEdit->text();
  settings.outputFile = m_lastOutput;
  settings.save();
}

void ProfileToolWindow::updateStatus() {
  const bool haveFolder = QFileInfo(m_dicomEdit->text()).isDir();
  const bool havePoints = QFileInfo(m_pointsEdit->text()).isFile();
  m_infoButton->setEnabled(haveFolder);
  m_writeButton->setEnabled(haveFolder && havePoints);
  if (!m_tool.hasInputs()) {
    m_statusLabel->setText(tr("No DICOM data loaded"));
    return;
  }
  const BeamGeometry &beam = m_tool.beam();
  const std::optional<cv::Vec3d> zero = m_tool.zeroPoint();
  QString text = tr("Beam %1 (%2)").arg(beam.beamNumber).arg(beam.beamName);
  if (zero) {
    text += tr(", zero point (%1, %2, %3) cm")
                .arg((*zero)[0] / 10.0, 0, 'f', 2)
                .arg((*zero)[1] / 10.0, 0, 'f', 2)
                .arg((*zero)[2] / 10.0, 0, 'f', 2);
  } else {
    text += tr(", zero point unavailable");
  }
  if (beam.monitorUnits) {
    text += tr(", %1 MU").arg(*beam.monitorUnits, 0, 'f', 1);
  }
  m_statusLabel->setText(text);
}

void ProfileToolWindow::onBrowseDicom() {
  const QString dir = QFileDialog::getExistingDirectory(this, tr("Select DICOM folder"),
                                                        m_dicomEdit->text());
  if (!dir.isEmpty()) {
    m_dicomEdit->setText(dir);
  }
}

void ProfileToolWindow::onBrowsePoints() {
  const QString file = QFileDialog::getOpenFileName(this, tr("Select profile points file"),
                                                    m_pointsEdit->text(),
                                                    tr("CSV files (*.csv);;All files (*)"));
  if (!file.isEmpty()) {
    m_pointsEdit->setText(file);
  }
}

bool ProfileToolWindow::ensureLoaded() {
  const QString folder = m_dicomEdit->text();
  if (m_tool.hasInputs() && folder == m_loadedFolder) {
    return true;
  }
  try {
    m_tool.loadFolder(folder, m_baseOptions.beamIndex, currentOptions().interpolation);
    m_loadedFolder = folder;
  } catch (const ProfileToolError &e) {
    qCWarning(AppLog) << "Loading" << folder << "failed:" << e.what();
    QMessageBox::critical(this, tr("DICOM"), QString::fromStdString(e.what()));
    m_loadedFolder.clear();
    updateStatus();
    return false;
  }
  updateStatus();
  return true;
}

void ProfileToolWindow::onWriteProfiles() {
  if (!ensureLoaded()) {
    return;
  }
  const QString output = QFileDialog::getSaveFileName(this, tr("Save profiles"), m_lastOutput,
                                                      tr("CSV files (*.csv)"));
  if (output.isEmpty()) {
    return;
  }
  m_lastOutput = output;
  storeSettings();

  try {
    const std::size_t count = m_tool.profilesFromFile(m_pointsEdit->text(), output, currentOptions());
    m_statusLabel->setText(tr("Wrote %1 profiles to %2").arg(count).arg(output));
  } catch (const ProfileToolError &e) {
    qCCritical(AppLog) << e.what();
    QMessageBox::critical(this, tr("Write Profiles"), QString::fromStdString(e.what()));
  }
}

void ProfileToolWindow::onViewDicomInfo() {
  if (!ensureLoaded()) {
    return;
  }
  QDialog *dialog = new QDialog(this);
  dialog->setAttribute(Qt::WA_DeleteOnClose);
  dialog->setWindowTitle(tr("DICOM Info"));
  dialog->resize(800, 600);
  QVBoxLayout *layout = new QVBoxLayout(dialog);
  QTabWidget *tabs = new QTabWidget(dialog);
  layout->addWidget(tabs);

  const QMap<QString, QString> &files = m_tool.folderContents().filesByModality;
  for (auto it = files.cbegin(); it != files.cend(); ++it) {
    QPlainTextEdit *text = new QPlainTextEdit(tabs);
    text->setReadOnly(true);
    text->setLineWrapMode(QPlainTextEdit::NoWrap);
    try {
      text->setPlainText(DicomFolderScanner::dumpFile(it.value()));
    } catch (const DicomReadError &e) {
      text->setPlainText(QString::fromStdString(e.what()));
    }
    tabs->addTab(text, it.key());
  }
  dialog->show();
}

} // namespace DoseProfile
