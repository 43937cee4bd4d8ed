// Built-in fallback chart: a short piano riff over an electric bass line,
// with two sustained notes.

#include "chart/default_chart.h"

#include "chart/chart_reader.h"

namespace lanefall {

const char* defaultChartCsv() {
  return "user_played,instrument_name,velocity,pitch,start,end\n"
         "True,piano,80,60,0.0,0.25\n"
         "False,bass-electric,70,36,0.0,0.5\n"
         "True,piano,80,62,0.5,0.75\n"
         "True,piano,80,65,1.0,1.25\n"
         "False,bass-electric,70,41,1.0,1.5\n"
         "True,piano,85,67,1.5,3.0\n"
         "True,piano,80,64,3.0,3.25\n"
         "False,bass-electric,70,43,3.0,3.5\n"
         "True,piano,80,61,3.5,3.75\n"
         "True,piano,80,63,3.5,3.75\n"
         "True,piano,80,60,4.0,4.25\n"
         "False,bass-electric,70,36,4.0,4.5\n"
         "True,piano,80,66,4.5,4.75\n"
         "True,piano,85,69,5.0,6.75\n"
         "False,bass-electric,70,45,5.0,6.0\n"
         "True,piano,80,62,7.0,7.25\n"
         "True,piano,80,60,7.5,8.0\n"
         "False,bass-electric,70,36,7.5,8.5\n";
}

std::vector<Note> loadDefaultChart() {
  ChartReader reader;
  reader.parse(defaultChartCsv());
  return reader.getNotes();
}

}  // namespace lanefall
